
#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include <boost/json.hpp>

#include "details/ast-core.hpp"
#include "date_provider.hpp"
#include "errors.hpp"
#include "operators.hpp"
#include "value.hpp"

namespace ruleval {

//
// API to create an expression

/// result type of create_logic
using logic_rule_base = std::tuple<any_expr, std::vector<std::string>, bool>;

/// interprets the json object \ref n as a rule and
///   returns its syntax tree together with some information
///   on variables inside the rule.
/// \param n     the rule
/// \param ops   the operators available to the rule
/// \details
///    single key objects whose key is not in \ref ops are translated to
///    error nodes that throw unrecognized_operator when evaluated.
logic_rule_base create_logic(const boost::json::value &n,
                             const operator_registry &ops = operator_registry::standard());


//
// API to evaluate/apply an expression

/// settings for evaluation
struct engine_config {
  /// operators used when apply translates a json rule
  operator_registry operators = operator_registry::standard();

  /// calendar services for date, datetime, today, and date arithmetic
  std::shared_ptr<const date_provider> dates = default_date_provider();

  /// receives the output of log and warnings; never null
  std::ostream *log_stream = nullptr;

  /// maximal nesting depth of rule evaluation, 0 for unlimited
  std::size_t max_depth = 0;

  engine_config();
};

/// returns the configuration used when none is specified
const engine_config &default_config();

/// evaluates \ref exp against the data context \ref data.
/// \param  exp    a syntax tree created by create_logic
/// \param  data   the value var resolves against
/// \param  config evaluation settings
/// \return the result value
/// \throws unrecognized_operator, type_error, date_error, depth_limit_error,
///         and any exception thrown by custom operators or the date provider.
/// \{
value_variant apply(const expr &exp, const value_variant &data,
                    const engine_config &config = default_config());
value_variant apply(const any_expr &exp, const value_variant &data,
                    const engine_config &config = default_config());
/// \}

/// evaluates the rule \ref rule with the provided data \ref data.
/// \param  rule a rule
/// \param  data a json value that the rule may access through variables.
/// \return the result value
/// \details
///    converts rule to a syntax tree using config.operators
///    before calling apply() on it.
value_variant apply(const boost::json::value &rule,
                    const boost::json::value &data = boost::json::object(),
                    const engine_config &config = default_config());

//
// conversion functions

/// creates a json representation from \p e
/// \details
///    operands are always written as array, i.e., {"var":"a"}
///    becomes {"var":["a"]}.
boost::json::value to_json(const any_expr &e);

//
// rule inspection

/// returns true if \p rule has the shape of an operator application,
///   i.e., an object with exactly one key.
bool is_logic(const boost::json::value &rule);

/// tests whether \p rule matches \p pattern
/// \details
///    * "@" matches any rule or value.
///    * "number", "string", and "array" match values of that kind.
///    * {"op": operands} matches rules with the same operator whose
///      operands match; an operator "@" matches any operator.
///    * arrays match arrays of the same length element by element.
///    * other values match equal values.
///    Unary operands are normalized to arrays on both sides.
bool rule_like(const boost::json::value &rule, const boost::json::value &pattern);


/// convenience class providing named accessors to logic_rule_base
struct logic_rule : logic_rule_base {
    using base = logic_rule_base;

    // no explicit
    logic_rule(logic_rule_base&& logic_object)
    : base(std::move(logic_object))
    {}

    logic_rule(logic_rule&&)            = default;
    logic_rule& operator=(logic_rule&&) = default;
    ~logic_rule()                       = default;

    /// the logic expression
    any_expr const &syntax_tree() const;

    /// returns variable names that are not computed, in order of
    ///   first appearance.
    /// \details names inside the per-element rules of map, filter,
    ///          reduce, all, some, and none are not included.
    std::vector<std::string> const &variable_names() const;

    /// returns if the expression contains computed names.
    bool has_computed_variable_names() const;

    /// evaluates the logic_rule against \p data.
    value_variant apply(const value_variant &data,
                        const engine_config &config = default_config()) const;

  private:
    logic_rule()                             = delete;
    logic_rule(const logic_rule&)            = delete;
    logic_rule& operator=(const logic_rule&) = delete;
};


} // namespace ruleval
