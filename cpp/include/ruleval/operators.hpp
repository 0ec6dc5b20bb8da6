
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "details/ast-core.hpp"
#include "value.hpp"

#if !defined(RULEVAL_WITH_EXTENSIONS)
#define RULEVAL_WITH_EXTENSIONS 1
#endif /* !defined(RULEVAL_WITH_EXTENSIONS) */

namespace ruleval {

/// the closed set of operators the evaluator implements natively
enum class builtin_op {
  // comparison
  equal,
  strict_equal,
  not_equal,
  strict_not_equal,
  less,
  greater,
  less_or_equal,
  greater_or_equal,

  // logic and control
  logical_not,
  logical_not_not,
  logical_and,
  logical_or,
  if_expr,
  ternary,

  // arithmetic
  add,
  subtract,
  multiply,
  divide,
  modulo,
  min,
  max,

  // strings and arrays
  membership,
  cat,
  substr,
  merge,

  // sequences
  map,
  filter,
  reduce,
  all,
  none,
  some,

  // data access
  var,
  missing,
  missing_some,

  // dates
  today,
  date,
  datetime,
  rdelta,

  log,

#if RULEVAL_WITH_EXTENSIONS
  count,
  regex_match,
#endif /* RULEVAL_WITH_EXTENSIONS */
};

/// tells whether operands are evaluated before an operator is invoked
enum class evaluation_mode { eager, lazy };

/// describes a built-in operator
struct builtin_descriptor {
  std::string_view name;
  builtin_op       op;
  evaluation_mode  mode;

  /// false for operators that control evaluation order or the
  ///   data context. Those cannot be replaced by custom operators.
  bool             overridable;
};

/// evaluates an expression against a data context
using evaluate_fn = std::function<value_variant(const expr &, const value_variant &)>;

/// custom operator that receives evaluated operands
using eager_function = std::function<value_variant(const std::vector<value_variant> &)>;

/// custom operator that receives unevaluated operands, the current data
///   context, and a callback to evaluate operands on demand.
using lazy_function =
    std::function<value_variant(const operand_list &, const value_variant &, const evaluate_fn &)>;

/// describes a custom operator
struct operator_descriptor {
  enum { variadic = -1 };

  /// number of operands the operator takes; extra operands are ignored,
  ///   missing ones are passed as null to eager operators.
  int             arity = variadic;
  evaluation_mode mode  = evaluation_mode::eager;
  eager_function  eager_fn;
  lazy_function   lazy_fn;

  static operator_descriptor eager(eager_function fn, int arity = variadic);
  static operator_descriptor lazy(lazy_function fn, int arity = variadic);
};

/// maps operator names to built-in and custom operators
/// \details
///    the registry is a plain value: it is set up before rules are created
///    and then only read. Lookups consult
///    (1) the built-in operators that cannot be overridden,
///    (2) the custom operators,
///    (3) the remaining built-in operators.
struct operator_registry {
    /// result of a lookup; at most one of the two members is set
    struct entry {
      const builtin_descriptor*                  builtin = nullptr;
      std::shared_ptr<const operator_descriptor> custom  = nullptr;

      bool found() const { return builtin || custom; }
    };

    operator_registry() = default;

    /// returns a registry with only the built-in operators
    static const operator_registry &standard();

    /// returns the table of built-in operators
    static const std::vector<builtin_descriptor> &builtins();

    /// returns the descriptor of \p op
    static const builtin_descriptor &builtin(builtin_op op);

    /// adds or replaces the custom operator \p name
    /// \throws std::invalid_argument if \p desc has no function for its mode
    ///         or \p name is empty.
    operator_registry &add_operator(std::string name, operator_descriptor desc);

    /// removes the custom operator \p name; a built-in operator with the
    ///   same name becomes visible again.
    /// \return true if a custom operator was removed
    bool rm_operator(std::string_view name);

    /// looks up \p name
    entry lookup(std::string_view name) const;

    /// returns true if \p name names any operator
    bool contains(std::string_view name) const;

    /// returns the names of all visible operators in sorted order
    std::vector<std::string> names() const;

  private:
    using custom_table =
        std::map<std::string, std::shared_ptr<const operator_descriptor>, std::less<>>;

    custom_table custom_ops;
};

} // namespace ruleval
