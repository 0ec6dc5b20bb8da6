/// implements rule translation and evaluation

#include "ruleval/logic.hpp"

// standard headers
#include <algorithm>
#include <charconv>
#include <cmath>
#include <exception>
#include <iostream>
#include <iterator>
#include <limits>
#include <map>
#include <numeric>
#include <sstream>
#include <string>

#if RULEVAL_WITH_EXTENSIONS
#include <regex>
#endif /* RULEVAL_WITH_EXTENSIONS */

// 3rd party headers
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/json.hpp>

// ruleval complete headers
#include "ruleval/details/ast-full.hpp"
#include "ruleval/details/cxx-compat.hpp"

namespace ruleval {

namespace json = boost::json;
namespace greg = boost::gregorian;
namespace ptm  = boost::posix_time;

using any_value = value_variant;

namespace {
CXX_NORETURN
void unsupported() {
  throw std::logic_error("functionality not yet implemented");
}

CXX_NORETURN
void throw_type_error(const std::string &msg) { throw type_error(msg); }

template <class Error = std::runtime_error, class T>
T &deref(T *p, const char *msg = "assertion failed") {
  if (p == nullptr) {
    CXX_UNLIKELY;
    throw Error{msg};
  }

  return *p;
}

template <class Error = std::runtime_error, class T>
const T &deref(const std::unique_ptr<T> &p,
               const char *msg = "assertion failed") {
  if (p.get() == nullptr) {
    CXX_UNLIKELY;
    throw Error{msg};
  }

  return *p;
}

template <class T>
const T &up_cast(const T &n) {
  return n;
}

template <class T>
struct down_caster_internal {
  const T *operator()(const expr &) const { return nullptr; }

  const T *operator()(const T &o) const { return &o; }
};

template <class T>
const T *may_down_cast(const expr &e) {
  return generic_visit(down_caster_internal<T>{}, &e);
}
}  // namespace

//
// foundation classes
// \{

// accept implementations
void equal::accept(visitor &v) const { v.visit(*this); }
void strict_equal::accept(visitor &v) const { v.visit(*this); }
void not_equal::accept(visitor &v) const { v.visit(*this); }
void strict_not_equal::accept(visitor &v) const { v.visit(*this); }
void less::accept(visitor &v) const { v.visit(*this); }
void greater::accept(visitor &v) const { v.visit(*this); }
void less_or_equal::accept(visitor &v) const { v.visit(*this); }
void greater_or_equal::accept(visitor &v) const { v.visit(*this); }
void logical_and::accept(visitor &v) const { v.visit(*this); }
void logical_or::accept(visitor &v) const { v.visit(*this); }
void logical_not::accept(visitor &v) const { v.visit(*this); }
void logical_not_not::accept(visitor &v) const { v.visit(*this); }
void add::accept(visitor &v) const { v.visit(*this); }
void subtract::accept(visitor &v) const { v.visit(*this); }
void multiply::accept(visitor &v) const { v.visit(*this); }
void divide::accept(visitor &v) const { v.visit(*this); }
void modulo::accept(visitor &v) const { v.visit(*this); }
void min::accept(visitor &v) const { v.visit(*this); }
void max::accept(visitor &v) const { v.visit(*this); }
void map::accept(visitor &v) const { v.visit(*this); }
void reduce::accept(visitor &v) const { v.visit(*this); }
void filter::accept(visitor &v) const { v.visit(*this); }
void all::accept(visitor &v) const { v.visit(*this); }
void none::accept(visitor &v) const { v.visit(*this); }
void some::accept(visitor &v) const { v.visit(*this); }
void array::accept(visitor &v) const { v.visit(*this); }
void merge::accept(visitor &v) const { v.visit(*this); }
void cat::accept(visitor &v) const { v.visit(*this); }
void substr::accept(visitor &v) const { v.visit(*this); }
void membership::accept(visitor &v) const { v.visit(*this); }
void var::accept(visitor &v) const { v.visit(*this); }
void missing::accept(visitor &v) const { v.visit(*this); }
void missing_some::accept(visitor &v) const { v.visit(*this); }
void today::accept(visitor &v) const { v.visit(*this); }
void date::accept(visitor &v) const { v.visit(*this); }
void datetime::accept(visitor &v) const { v.visit(*this); }
void rdelta::accept(visitor &v) const { v.visit(*this); }
void log::accept(visitor &v) const { v.visit(*this); }
void custom_oper::accept(visitor &v) const { v.visit(*this); }
void if_expr::accept(visitor &v) const { v.visit(*this); }
void ternary::accept(visitor &v) const { v.visit(*this); }

void null_value::accept(visitor &v) const { v.visit(*this); }
void bool_value::accept(visitor &v) const { v.visit(*this); }
void int_value::accept(visitor &v) const { v.visit(*this); }
void unsigned_int_value::accept(visitor &v) const { v.visit(*this); }
void real_value::accept(visitor &v) const { v.visit(*this); }
void string_value::accept(visitor &v) const { v.visit(*this); }
void object_value::accept(visitor &v) const { v.visit(*this); }

void error::accept(visitor &v) const { v.visit(*this); }

#if RULEVAL_WITH_EXTENSIONS
void count::accept(visitor &v) const { v.visit(*this); }
void regex_match::accept(visitor &v) const { v.visit(*this); }
#endif /* RULEVAL_WITH_EXTENSIONS */

// to_json implementations
template <class T>
json::value value_generic<T>::to_json() const {
  return ruleval::to_json(to_variant());
}

json::value null_value::to_json() const { return nullptr; }

// to_variant implementations
template <class T>
value_variant value_generic<T>::to_variant() const {
  return value();
}

value_variant null_value::to_variant() const { return value(); }

// num_evaluated_operands implementations
int oper::num_evaluated_operands() const { return size(); }

template <int MaxArity>
int oper_n<MaxArity>::num_evaluated_operands() const {
  return std::min(MaxArity, oper::num_evaluated_operands());
}

int custom_oper::num_evaluated_operands() const {
  const int arity = descriptor().arity;

  if (arity == operator_descriptor::variadic) return oper::num_evaluated_operands();

  return std::min(arity, oper::num_evaluated_operands());
}

expr &oper::operand(int n) const { return deref(this->at(n).get()); }

// \}

struct forwarding_visitor : visitor {
  void visit(const expr &) override {}  // error
  void visit(const oper &n) override { visit(up_cast<expr>(n)); }
  void visit(const equal &n) override { visit(up_cast<oper>(n)); }
  void visit(const strict_equal &n) override { visit(up_cast<oper>(n)); }
  void visit(const not_equal &n) override { visit(up_cast<oper>(n)); }
  void visit(const strict_not_equal &n) override { visit(up_cast<oper>(n)); }
  void visit(const less &n) override { visit(up_cast<oper>(n)); }
  void visit(const greater &n) override { visit(up_cast<oper>(n)); }
  void visit(const less_or_equal &n) override { visit(up_cast<oper>(n)); }
  void visit(const greater_or_equal &n) override { visit(up_cast<oper>(n)); }
  void visit(const logical_and &n) override { visit(up_cast<oper>(n)); }
  void visit(const logical_or &n) override { visit(up_cast<oper>(n)); }
  void visit(const logical_not &n) override { visit(up_cast<oper>(n)); }
  void visit(const logical_not_not &n) override { visit(up_cast<oper>(n)); }
  void visit(const add &n) override { visit(up_cast<oper>(n)); }
  void visit(const subtract &n) override { visit(up_cast<oper>(n)); }
  void visit(const multiply &n) override { visit(up_cast<oper>(n)); }
  void visit(const divide &n) override { visit(up_cast<oper>(n)); }
  void visit(const modulo &n) override { visit(up_cast<oper>(n)); }
  void visit(const min &n) override { visit(up_cast<oper>(n)); }
  void visit(const max &n) override { visit(up_cast<oper>(n)); }
  void visit(const map &n) override { visit(up_cast<oper>(n)); }
  void visit(const reduce &n) override { visit(up_cast<oper>(n)); }
  void visit(const filter &n) override { visit(up_cast<oper>(n)); }
  void visit(const all &n) override { visit(up_cast<oper>(n)); }
  void visit(const none &n) override { visit(up_cast<oper>(n)); }
  void visit(const some &n) override { visit(up_cast<oper>(n)); }
  void visit(const merge &n) override { visit(up_cast<oper>(n)); }
  void visit(const cat &n) override { visit(up_cast<oper>(n)); }
  void visit(const substr &n) override { visit(up_cast<oper>(n)); }
  void visit(const membership &n) override { visit(up_cast<oper>(n)); }
  void visit(const var &n) override { visit(up_cast<oper>(n)); }
  void visit(const missing &n) override { visit(up_cast<oper>(n)); }
  void visit(const missing_some &n) override { visit(up_cast<oper>(n)); }
  void visit(const today &n) override { visit(up_cast<oper>(n)); }
  void visit(const date &n) override { visit(up_cast<oper>(n)); }
  void visit(const datetime &n) override { visit(up_cast<oper>(n)); }
  void visit(const rdelta &n) override { visit(up_cast<oper>(n)); }
  void visit(const log &n) override { visit(up_cast<oper>(n)); }
  void visit(const custom_oper &n) override { visit(up_cast<oper>(n)); }

  void visit(const if_expr &n) override { visit(up_cast<oper>(n)); }
  void visit(const ternary &n) override { visit(up_cast<oper>(n)); }

  void visit(const value_base &n) override { visit(up_cast<expr>(n)); }
  void visit(const null_value &n) override { visit(up_cast<value_base>(n)); }
  void visit(const bool_value &n) override { visit(up_cast<value_base>(n)); }
  void visit(const int_value &n) override { visit(up_cast<value_base>(n)); }
  void visit(const unsigned_int_value &n) override {
    visit(up_cast<value_base>(n));
  }
  void visit(const real_value &n) override { visit(up_cast<value_base>(n)); }
  void visit(const string_value &n) override { visit(up_cast<value_base>(n)); }
  void visit(const object_value &n) override { visit(up_cast<value_base>(n)); }

  void visit(const array &n) override { visit(up_cast<oper>(n)); }

  void visit(const error &n) override { visit(up_cast<expr>(n)); }

#if RULEVAL_WITH_EXTENSIONS
  // extensions
  void visit(const count &n) override { visit(up_cast<oper>(n)); }
  void visit(const regex_match &n) override { visit(up_cast<oper>(n)); }
#endif /* RULEVAL_WITH_EXTENSIONS */
};

namespace {

/// returns the operator name of the operator node \p n
struct operator_namer : forwarding_visitor {
  void visit(const equal &n) final { _builtin(n); }
  void visit(const strict_equal &n) final { _builtin(n); }
  void visit(const not_equal &n) final { _builtin(n); }
  void visit(const strict_not_equal &n) final { _builtin(n); }
  void visit(const less &n) final { _builtin(n); }
  void visit(const greater &n) final { _builtin(n); }
  void visit(const less_or_equal &n) final { _builtin(n); }
  void visit(const greater_or_equal &n) final { _builtin(n); }
  void visit(const logical_and &n) final { _builtin(n); }
  void visit(const logical_or &n) final { _builtin(n); }
  void visit(const logical_not &n) final { _builtin(n); }
  void visit(const logical_not_not &n) final { _builtin(n); }
  void visit(const add &n) final { _builtin(n); }
  void visit(const subtract &n) final { _builtin(n); }
  void visit(const multiply &n) final { _builtin(n); }
  void visit(const divide &n) final { _builtin(n); }
  void visit(const modulo &n) final { _builtin(n); }
  void visit(const min &n) final { _builtin(n); }
  void visit(const max &n) final { _builtin(n); }
  void visit(const map &n) final { _builtin(n); }
  void visit(const reduce &n) final { _builtin(n); }
  void visit(const filter &n) final { _builtin(n); }
  void visit(const all &n) final { _builtin(n); }
  void visit(const none &n) final { _builtin(n); }
  void visit(const some &n) final { _builtin(n); }
  void visit(const merge &n) final { _builtin(n); }
  void visit(const cat &n) final { _builtin(n); }
  void visit(const substr &n) final { _builtin(n); }
  void visit(const membership &n) final { _builtin(n); }
  void visit(const var &n) final { _builtin(n); }
  void visit(const missing &n) final { _builtin(n); }
  void visit(const missing_some &n) final { _builtin(n); }
  void visit(const today &n) final { _builtin(n); }
  void visit(const date &n) final { _builtin(n); }
  void visit(const datetime &n) final { _builtin(n); }
  void visit(const rdelta &n) final { _builtin(n); }
  void visit(const log &n) final { _builtin(n); }
  void visit(const if_expr &n) final { _builtin(n); }
  void visit(const ternary &n) final { _builtin(n); }

  void visit(const custom_oper &n) final { name = n.name(); }
  void visit(const error &n) final { name = n.name(); }

#if RULEVAL_WITH_EXTENSIONS
  void visit(const count &n) final { _builtin(n); }
  void visit(const regex_match &n) final { _builtin(n); }
#endif /* RULEVAL_WITH_EXTENSIONS */

  std::string_view name;

 private:
  template <class OperatorNode>
  void _builtin(const OperatorNode &) {
    name = operator_registry::builtin(OperatorNode::id).name;
  }
};

std::string_view operator_name(const expr &n) {
  operator_namer namer;

  n.accept(namer);
  return namer.name;
}

//
// translation from json

struct variable_map {
  void insert(var &el);
  std::vector<std::string> to_vector() const;

  /// accessors for withComputedNames
  /// \{
  bool hasComputedVariables() const { return withComputedNames; }
  void setComputedVariables(bool b) { withComputedNames = b; }
  /// \}

  /// names inside per-element rules refer to the elements, not to the data
  /// \{
  void enter_scope() { ++scopeDepth; }
  void leave_scope() { --scopeDepth; }
  /// \}

 private:
  using container_type = std::map<std::string, int>;

  container_type mapping = {};
  bool withComputedNames = false;
  int scopeDepth = 0;
};

void variable_map::insert(var &var) {
  if (scopeDepth > 0) return;

  // {"var":[]} reads the entire data context
  if (var.size() == 0) return;

  const expr &arg = var.operand(0);
  std::string name;

  if (const string_value *str = may_down_cast<string_value>(arg))
    name = str->value();
  else if (const int_value *num = may_down_cast<int_value>(arg))
    name = std::to_string(num->value());
  else if (const unsigned_int_value *unum = may_down_cast<unsigned_int_value>(arg))
    name = std::to_string(unum->value());
  else if (may_down_cast<null_value>(arg) == nullptr)
    setComputedVariables(true);

  if (name.empty()) return;

  auto pos = mapping.emplace(name, int(mapping.size())).first;

  var.num(pos->second);
}

std::vector<std::string> variable_map::to_vector() const {
  std::vector<std::string> res;

  res.resize(mapping.size());

  for (const container_type::value_type &el : mapping)
    res.at(el.second) = el.first;

  return res;
}

any_expr translate_internal(const json::value &n, variable_map &, const operator_registry &);

/// translates all children
/// \{
operand_list translate_children(const json::array &children, variable_map &, const operator_registry &);

operand_list translate_children(const json::value &n, variable_map &, const operator_registry &);
/// \}

template <class ExprT>
std::unique_ptr<ExprT> mk_operator_(const json::object &n, variable_map &m, const operator_registry &ops) {
  std::unique_ptr<ExprT> res = std::make_unique<ExprT>();

  res->set_operands(translate_children(n.begin()->value(), m, ops));
  return res;
}

template <class ExprT>
any_expr mk_operator(const json::object &n, variable_map &m, const operator_registry &ops) {
  return mk_operator_<ExprT>(n, m, ops);
}

/// the second operand of a sequence operator is evaluated per element
template <class ExprT>
any_expr mk_sequence_operator(const json::object &n, variable_map &m, const operator_registry &ops) {
  const json::value &args = n.begin()->value();
  const json::array *arr = args.if_array();

  if (arr == nullptr) return mk_operator<ExprT>(n, m, ops);

  std::unique_ptr<ExprT> res = std::make_unique<ExprT>();
  operand_list opers;
  int idx = 0;

  opers.reserve(arr->size());

  for (const json::value &elem : *arr) {
    const bool scoped = (idx == 1);

    if (scoped) m.enter_scope();

    opers.emplace_back(translate_internal(elem, m, ops));

    if (scoped) m.leave_scope();

    ++idx;
  }

  res->set_operands(std::move(opers));
  return res;
}

template <class ExprT>
any_expr mk_missing(const json::object &n, variable_map &m, const operator_registry &ops) {
  // the names are data that may be computed
  m.setComputedVariables(true);
  return mk_operator<ExprT>(n, m, ops);
}

any_expr mk_variable(const json::object &n, variable_map &m, const operator_registry &ops) {
  std::unique_ptr<var> v = mk_operator_<var>(n, m, ops);

  m.insert(*v);
  return v;
}

any_expr mk_custom(const json::object &n, std::shared_ptr<const operator_descriptor> desc,
                   variable_map &m, const operator_registry &ops) {
  std::unique_ptr<custom_oper> res =
      std::make_unique<custom_oper>(std::string(n.begin()->key()), std::move(desc));

  res->set_operands(translate_children(n.begin()->value(), m, ops));
  return res;
}

any_expr mk_array(const json::array &children, variable_map &m, const operator_registry &ops) {
  std::unique_ptr<array> res = std::make_unique<array>();

  res->set_operands(translate_children(children, m, ops));
  return res;
}

template <class value_t>
any_expr mk_value(typename value_t::value_type n) {
  return std::make_unique<value_t>(std::move(n));
}

using dispatch_table =
    std::map<builtin_op, any_expr (*)(const json::object &, variable_map &, const operator_registry &)>;

const dispatch_table &builtin_dispatch() {
  static const dispatch_table dt = {
      {builtin_op::equal, &mk_operator<equal>},
      {builtin_op::strict_equal, &mk_operator<strict_equal>},
      {builtin_op::not_equal, &mk_operator<not_equal>},
      {builtin_op::strict_not_equal, &mk_operator<strict_not_equal>},
      {builtin_op::if_expr, &mk_operator<if_expr>},
      {builtin_op::ternary, &mk_operator<ternary>},
      {builtin_op::logical_not, &mk_operator<logical_not>},
      {builtin_op::logical_not_not, &mk_operator<logical_not_not>},
      {builtin_op::logical_or, &mk_operator<logical_or>},
      {builtin_op::logical_and, &mk_operator<logical_and>},
      {builtin_op::greater, &mk_operator<greater>},
      {builtin_op::greater_or_equal, &mk_operator<greater_or_equal>},
      {builtin_op::less, &mk_operator<less>},
      {builtin_op::less_or_equal, &mk_operator<less_or_equal>},
      {builtin_op::max, &mk_operator<max>},
      {builtin_op::min, &mk_operator<min>},
      {builtin_op::add, &mk_operator<add>},
      {builtin_op::subtract, &mk_operator<subtract>},
      {builtin_op::multiply, &mk_operator<multiply>},
      {builtin_op::divide, &mk_operator<divide>},
      {builtin_op::modulo, &mk_operator<modulo>},
      {builtin_op::map, &mk_sequence_operator<map>},
      {builtin_op::reduce, &mk_sequence_operator<reduce>},
      {builtin_op::filter, &mk_sequence_operator<filter>},
      {builtin_op::all, &mk_sequence_operator<all>},
      {builtin_op::none, &mk_sequence_operator<none>},
      {builtin_op::some, &mk_sequence_operator<some>},
      {builtin_op::merge, &mk_operator<merge>},
      {builtin_op::membership, &mk_operator<membership>},
      {builtin_op::cat, &mk_operator<cat>},
      {builtin_op::substr, &mk_operator<substr>},
      {builtin_op::log, &mk_operator<log>},
      {builtin_op::var, &mk_variable},
      {builtin_op::missing, &mk_missing<missing>},
      {builtin_op::missing_some, &mk_missing<missing_some>},
      {builtin_op::today, &mk_operator<today>},
      {builtin_op::date, &mk_operator<date>},
      {builtin_op::datetime, &mk_operator<datetime>},
      {builtin_op::rdelta, &mk_operator<rdelta>},
#if RULEVAL_WITH_EXTENSIONS
      /// extensions
      {builtin_op::count, &mk_operator<count>},
      {builtin_op::regex_match, &mk_operator<regex_match>},
#endif /* RULEVAL_WITH_EXTENSIONS */
  };

  return dt;
}

any_expr translate_internal(const json::value &n, variable_map &varmap, const operator_registry &ops) {
  switch (n.kind()) {
    case json::kind::object: {
      const json::object &obj = n.get_object();

      if (obj.size() != 1) {
        // not a rule, but a data object
        CXX_UNLIKELY;
        return mk_value<object_value>(std::get<object_ptr>(to_value(n)));
      }

      const json::string &key = obj.begin()->key();
      operator_registry::entry op = ops.lookup(std::string_view(key.data(), key.size()));

      if (op.builtin) {
        CXX_LIKELY;
        return builtin_dispatch().at(op.builtin->op)(obj, varmap, ops);
      }

      if (op.custom) return mk_custom(obj, std::move(op.custom), varmap, ops);

      // fails only when evaluated
      return std::make_unique<error>(std::string(key.data(), key.size()), obj.begin()->value());
    }

    case json::kind::array: {
      // array is an operator that combines its subexpressions into an array
      return mk_array(n.get_array(), varmap, ops);
    }

    case json::kind::string: {
      const json::string &str = n.get_string();

      return mk_value<string_value>(std::string(str.data(), str.size()));
    }

    case json::kind::int64:
      return mk_value<int_value>(n.get_int64());

    case json::kind::uint64:
      return mk_value<unsigned_int_value>(n.get_uint64());

    case json::kind::double_:
      return mk_value<real_value>(n.get_double());

    case json::kind::bool_:
      return mk_value<bool_value>(n.get_bool());

    case json::kind::null:
      return std::make_unique<null_value>();
  }

  unsupported();
}

operand_list translate_children(const json::array &children,
                                variable_map &varmap,
                                const operator_registry &ops) {
  operand_list res;

  res.reserve(children.size());

  for (const json::value &elem : children)
    res.emplace_back(translate_internal(elem, varmap, ops));

  return res;
}

operand_list translate_children(const json::value &n, variable_map &varmap, const operator_registry &ops) {
  if (const json::array *arr = n.if_array()) {
    CXX_LIKELY;
    return translate_children(*arr, varmap, ops);
  }

  operand_list res;

  res.emplace_back(translate_internal(n, varmap, ops));
  return res;
}
}  // namespace

logic_rule_base create_logic(const json::value &n, const operator_registry &ops) {
  variable_map varmap;
  any_expr node = translate_internal(n, varmap, ops);
  bool hasComputedVariables = varmap.hasComputedVariables();

  return {std::move(node), varmap.to_vector(), hasComputedVariables};
}

//
// evaluation

namespace {

//
// coercion functions

/// returns the value of an int or unsigned int number that fits into an int64
std::optional<std::int64_t> as_int64(const any_value &num) {
  if (const std::int64_t *ival = std::get_if<std::int64_t>(&num))
    return *ival;

  if (const std::uint64_t *uval = std::get_if<std::uint64_t>(&num)) {
    if (*uval <= std::uint64_t(std::numeric_limits<std::int64_t>::max()))
      return std::int64_t(*uval);
  }

  return std::nullopt;
}

constexpr std::int64_t INT64_LO = std::numeric_limits<std::int64_t>::min();
constexpr std::int64_t INT64_HI = std::numeric_limits<std::int64_t>::max();

bool add_overflow(std::int64_t lhs, std::int64_t rhs) {
  return (rhs > 0 && lhs > INT64_HI - rhs) || (rhs < 0 && lhs < INT64_LO - rhs);
}

bool subtract_overflow(std::int64_t lhs, std::int64_t rhs) {
  return (rhs < 0 && lhs > INT64_HI + rhs) || (rhs > 0 && lhs < INT64_LO + rhs);
}

bool multiply_overflow(std::int64_t lhs, std::int64_t rhs) {
  if (lhs == 0 || rhs == 0) return false;

  if (lhs > 0)
    return (rhs > 0) ? (lhs > INT64_HI / rhs) : (rhs < INT64_LO / lhs);

  return (rhs > 0) ? (lhs < INT64_LO / rhs) : (rhs < INT64_HI / lhs);
}

/// computes \p lhs op \p rhs after numeric coercion
/// \details
///    null operands produce null. Integers are computed as int64 and
///    the operator falls back to double where int64 is not sufficient.
/// \throws type_error if an operand is not numeric
template <class binary_op_t>
any_value compute(const any_value &lhs, const any_value &rhs, const binary_op_t &op) {
  if (is_null(lhs) || is_null(rhs)) return nullptr;

  any_value lnum = to_number(lhs);
  any_value rnum = to_number(rhs);
  std::optional<std::int64_t> lint = as_int64(lnum);
  std::optional<std::int64_t> rint = as_int64(rnum);

  if (lint && rint) {
    CXX_LIKELY;
    return op(*lint, *rint);
  }

  return op(to_double(lnum), to_double(rnum));
}

/// numeric cast used by unary +, *, min, and max
any_value numeric_cast(const any_value &val) {
  if (is_null(val)) return nullptr;

  any_value num = to_number(val);

  if (const double *rval = std::get_if<double>(&num))
    return normalize_number(*rval);

  return num;
}

template <class>
struct operator_impl {};

struct arithmetic_operator {
  using result_type = any_value;
};

template <>
struct operator_impl<add> : arithmetic_operator {
  result_type operator()(std::int64_t lhs, std::int64_t rhs) const {
    if (add_overflow(lhs, rhs)) return (*this)(double(lhs), double(rhs));

    return lhs + rhs;
  }

  result_type operator()(double lhs, double rhs) const {
    return normalize_number(lhs + rhs);
  }
};

template <>
struct operator_impl<subtract> : arithmetic_operator {
  result_type operator()(std::int64_t lhs, std::int64_t rhs) const {
    if (subtract_overflow(lhs, rhs)) return (*this)(double(lhs), double(rhs));

    return lhs - rhs;
  }

  result_type operator()(double lhs, double rhs) const {
    return normalize_number(lhs - rhs);
  }
};

template <>
struct operator_impl<multiply> : arithmetic_operator {
  result_type operator()(std::int64_t lhs, std::int64_t rhs) const {
    if (multiply_overflow(lhs, rhs)) return (*this)(double(lhs), double(rhs));

    return lhs * rhs;
  }

  result_type operator()(double lhs, double rhs) const {
    return normalize_number(lhs * rhs);
  }
};

template <>
struct operator_impl<divide> : arithmetic_operator {
  result_type operator()(double lhs, double rhs) const {
    if (rhs == 0) return nullptr;

    return normalize_number(lhs / rhs);
  }

  result_type operator()(std::int64_t lhs, std::int64_t rhs) const {
    if (rhs == 0) return nullptr;

    // INT64_LO / -1 overflows
    if ((lhs % rhs != 0) || (rhs == -1))
      return (*this)(double(lhs), double(rhs));

    return lhs / rhs;
  }
};

/// floored modulo; the result has the sign of the divisor
template <>
struct operator_impl<modulo> : arithmetic_operator {
  result_type operator()(std::int64_t lhs, std::int64_t rhs) const {
    if (rhs == 0) return nullptr;
    if (rhs == -1) return std::int64_t(0);

    std::int64_t res = lhs % rhs;

    if (res != 0 && ((res < 0) != (rhs < 0))) res += rhs;

    return res;
  }

  result_type operator()(double lhs, double rhs) const {
    if (rhs == 0) return nullptr;

    double res = std::fmod(lhs, rhs);

    if (res != 0 && ((res < 0) != (rhs < 0))) res += rhs;

    return normalize_number(res);
  }
};

template <>
struct operator_impl<min> : arithmetic_operator {
  result_type operator()(std::int64_t lhs, std::int64_t rhs) const {
    return std::min(lhs, rhs);
  }

  result_type operator()(double lhs, double rhs) const {
    return normalize_number(std::min(lhs, rhs));
  }
};

template <>
struct operator_impl<max> : arithmetic_operator {
  result_type operator()(std::int64_t lhs, std::int64_t rhs) const {
    return std::max(lhs, rhs);
  }

  result_type operator()(double lhs, double rhs) const {
    return normalize_number(std::max(lhs, rhs));
  }
};

// comparisons

template <>
struct operator_impl<equal> {
  bool operator()(const any_value &lhs, const any_value &rhs) const {
    return soft_equals(lhs, rhs);
  }
};

template <>
struct operator_impl<not_equal> {
  bool operator()(const any_value &lhs, const any_value &rhs) const {
    return !soft_equals(lhs, rhs);
  }
};

template <>
struct operator_impl<strict_equal> {
  bool operator()(const any_value &lhs, const any_value &rhs) const {
    return strict_equals(lhs, rhs);
  }
};

template <>
struct operator_impl<strict_not_equal> {
  bool operator()(const any_value &lhs, const any_value &rhs) const {
    return !strict_equals(lhs, rhs);
  }
};

template <>
struct operator_impl<less> {
  bool operator()(const any_value &lhs, const any_value &rhs) const {
    return compare(lhs, rhs) == ordering::less;
  }
};

template <>
struct operator_impl<greater> {
  bool operator()(const any_value &lhs, const any_value &rhs) const {
    return compare(lhs, rhs) == ordering::greater;
  }
};

template <>
struct operator_impl<less_or_equal> {
  bool operator()(const any_value &lhs, const any_value &rhs) const {
    const ordering res = compare(lhs, rhs);

    return res == ordering::less || res == ordering::equal;
  }
};

template <>
struct operator_impl<greater_or_equal> {
  bool operator()(const any_value &lhs, const any_value &rhs) const {
    const ordering res = compare(lhs, rhs);

    return res == ordering::greater || res == ordering::equal;
  }
};

template <>
struct operator_impl<logical_not> {
  bool operator()(const any_value &val) const { return falsy(val); }
};

template <>
struct operator_impl<logical_not_not> {
  bool operator()(const any_value &val) const { return truthy(val); }
};

/// date arithmetic for + and -
/// \details
///    * date - date and datetime - datetime produce a delta
///    * date +/- delta produces a date (datetime +/- delta a datetime)
///    * delta + date produces a date
///    * delta +/- delta produces a delta
///    Objects with the fields years, months, days are accepted as delta.
/// \return std::nullopt if neither operand is a date or a delta
std::optional<any_value> date_arithmetic(const any_value &lhs, const any_value &rhs,
                                         bool subtraction, const date_provider &dates) {
  const std::size_t li = lhs.index();
  const std::size_t ri = rhs.index();

  if (li == date_variant || li == dttm_variant) {
    if (subtraction && li == ri && li == date_variant) {
      const greg::date_duration diff = std::get<greg::date>(lhs) - std::get<greg::date>(rhs);

      return any_value(relative_delta{0, 0, diff.days(), 0});
    }

    if (subtraction && li == ri) {
      const ptm::time_duration diff = std::get<ptm::ptime>(lhs) - std::get<ptm::ptime>(rhs);
      const std::int64_t secs = diff.total_seconds();
      std::int64_t days = secs / 86400;

      if (secs % 86400 < 0) --days;

      return any_value(relative_delta{0, 0, days, secs - days * 86400});
    }

    std::optional<relative_delta> delta = as_relative_delta(rhs);

    if (!delta) {
      CXX_UNLIKELY;
      throw_type_error("date arithmetic requires a date and a delta");
    }

    if (subtraction) delta = -*delta;

    if (li == date_variant)
      return any_value(dates.add_delta(std::get<greg::date>(lhs), *delta));

    return any_value(dates.add_delta(std::get<ptm::ptime>(lhs), *delta));
  }

  if (ri == date_variant || ri == dttm_variant) {
    std::optional<relative_delta> delta = as_relative_delta(lhs);

    if (subtraction || !delta) {
      CXX_UNLIKELY;
      throw_type_error("date arithmetic requires a date and a delta");
    }

    if (ri == date_variant)
      return any_value(dates.add_delta(std::get<greg::date>(rhs), *delta));

    return any_value(dates.add_delta(std::get<ptm::ptime>(rhs), *delta));
  }

  if (li == dlta_variant && ri == dlta_variant) {
    const relative_delta &rdelta = std::get<relative_delta>(rhs);

    return any_value(std::get<relative_delta>(lhs) + (subtraction ? -rdelta : rdelta));
  }

  return std::nullopt;
}

/// splits a string into utf-8 code points
std::vector<std::string_view> code_points(std::string_view str) {
  std::vector<std::string_view> res;
  std::size_t pos = 0;

  while (pos < str.size()) {
    std::size_t len = 1;

    // skip continuation bytes (10xxxxxx)
    while (pos + len < str.size() && (static_cast<unsigned char>(str[pos + len]) & 0xC0) == 0x80)
      ++len;

    res.push_back(str.substr(pos, len));
    pos += len;
  }

  return res;
}

/// looks up \p path in \p data
/// \details
///    the path is split at dots; each segment selects an object member,
///    or an array element if the segment is a non-negative integer.
/// \return the value or std::nullopt if the path does not exist
std::optional<any_value> eval_path(const any_value &data, const any_value &path) {
  std::string name;

  switch (path.index()) {
    case null_variant:
      return data;

    case strg_variant:
      name = std::get<std::string>(path);
      break;

    case int_variant:
    case uint_variant:
    case real_variant:
      name = to_string(path);
      break;

    default:
      return std::nullopt;
  }

  if (name.empty()) return data;

  const any_value *curr = &data;
  std::string_view rest = name;

  while (true) {
    const std::size_t dot = rest.find('.');
    const std::string_view segment = rest.substr(0, dot);

    if (const object_ptr *obj = std::get_if<object_ptr>(curr)) {
      auto pos = (*obj)->find(segment);

      if (pos == (*obj)->end()) return std::nullopt;

      curr = &pos->second;
    } else if (const array_ptr *arr = std::get_if<array_ptr>(curr)) {
      std::size_t idx = 0;
      auto [ptr, err] = std::from_chars(segment.data(), segment.data() + segment.size(), idx);

      if (  err != std::errc{}
         || ptr != segment.data() + segment.size()
         || segment.empty()
         || idx >= (*arr)->size()
         )
        return std::nullopt;

      curr = &(**arr)[idx];
    } else {
      return std::nullopt;
    }

    if (dot == std::string_view::npos) break;

    rest.remove_prefix(dot + 1);
  }

  return *curr;
}

/// a node for operands that are absent
const null_value &null_rule() {
  static const null_value node;

  return node;
}

struct evaluator : forwarding_visitor {
  evaluator(const any_value &data, const engine_config &cfg, std::size_t depth = 0)
      : context(data), config(cfg),
        logger(deref<std::invalid_argument>(cfg.log_stream, "engine_config::log_stream is null")),
        calcres(nullptr), level(depth) {}

  void visit(const equal &) final;
  void visit(const strict_equal &) final;
  void visit(const not_equal &) final;
  void visit(const strict_not_equal &) final;
  void visit(const less &) final;
  void visit(const greater &) final;
  void visit(const less_or_equal &) final;
  void visit(const greater_or_equal &) final;
  void visit(const logical_and &) final;
  void visit(const logical_or &) final;
  void visit(const logical_not &) final;
  void visit(const logical_not_not &) final;
  void visit(const add &) final;
  void visit(const subtract &) final;
  void visit(const multiply &) final;
  void visit(const divide &) final;
  void visit(const modulo &) final;
  void visit(const min &) final;
  void visit(const max &) final;
  void visit(const array &) final;
  void visit(const map &) final;
  void visit(const reduce &) final;
  void visit(const filter &) final;
  void visit(const all &) final;
  void visit(const none &) final;
  void visit(const some &) final;
  void visit(const merge &) final;
  void visit(const cat &) final;
  void visit(const substr &) final;
  void visit(const membership &) final;
  void visit(const var &) final;
  void visit(const missing &) final;
  void visit(const missing_some &) final;
  void visit(const today &) final;
  void visit(const date &) final;
  void visit(const datetime &) final;
  void visit(const rdelta &) final;
  void visit(const log &) final;
  void visit(const custom_oper &) final;

  void visit(const if_expr &) final;
  void visit(const ternary &) final;

  void visit(const value_base &n) final;

  void visit(const error &n) final;

#if RULEVAL_WITH_EXTENSIONS
  void visit(const count &n) final;
  void visit(const regex_match &n) final;
#endif /* RULEVAL_WITH_EXTENSIONS */

  any_value eval(const expr &n);

  /// evaluates \p n against the data context \p data
  any_value eval_in(const expr &n, const any_value &data) const;

 private:
  const any_value &context;
  const engine_config &config;
  std::ostream &logger;
  any_value calcres;
  std::size_t level;

  evaluator(const evaluator &) = delete;
  evaluator(evaluator &&) = delete;
  evaluator &operator=(const evaluator &) = delete;
  evaluator &operator=(evaluator &&) = delete;

  //
  // opers

  /// evaluates n[argpos] or returns null if the operand is absent
  any_value eval_operand(const oper &n, int argpos);

  /// implements relop : [1, 2, 3, whatever] as 1 relop 2 relop 3
  /// \details all operands are evaluated before they are compared
  template <class binary_predicate_t>
  void eval_pairwise(const oper &n, binary_predicate_t pred);

  /// returns the first expression in [ e1, e2, e3 ] that evaluates to
  /// val,
  ///   or the last expression otherwise
  void eval_short_circuit(const oper &n, bool val);

  /// evaluates condition / branch pairs
  void eval_conditional(const oper &n);

  /// reduction operation on all elements
  template <class binary_op_t>
  void reduce_sequence(const oper &n, binary_op_t op, any_value neutral);

  /// + and - with support for dates
  template <class binary_op_t>
  any_value compute_with_dates(const any_value &lhs, const any_value &rhs,
                               const binary_op_t &op, bool subtraction) const;

  /// computes unary operation on n[0]
  template <class UnaryOperator>
  void unary(const oper &n, UnaryOperator calc);

  /// binary arithmetic operation on n[0] and n[1]
  template <class binary_op_t>
  void binary(const oper &n, binary_op_t binop);

  /// evaluates and unpacks n[argpos] to an integer
  std::int64_t unpack_optional_int_arg(const oper &n, int argpos,
                                       std::int64_t defaultVal);

  /// returns the names in \p names that are not available in the context
  value_array missing_aux(const value_array &names) const;

  /// returns the evaluated operands as array
  value_array eval_operands(const oper &n);

  /// the per element rule of a sequence operator
  const expr &sequence_rule(const oper &n) const;

  /// returns the first operand if it evaluates to an array
  array_ptr eval_sequence(const oper &n);
};

/// evaluates a rule with each element as data context
struct sequence_function {
  sequence_function(const expr &e, const evaluator &calc)
      : exp(e), ev(calc) {}

  any_value operator()(const any_value &elem) const {
    return ev.eval_in(exp, elem);
  }

 private:
  const expr &exp;
  const evaluator &ev;
};

struct sequence_predicate : sequence_function {
  using sequence_function::sequence_function;

  bool operator()(const any_value &elem) const {
    return truthy(sequence_function::operator()(elem));
  }
};

/// evaluates a rule with {"accumulator": accu, "current": elem} as data context
struct sequence_reduction {
  sequence_reduction(const expr &e, const evaluator &calc)
      : exp(e), ev(calc) {}

  // for compatibility reasons, the first argument is passed by value.
  //   std::accumulate moves the accumulator since C++20.
  any_value operator()(any_value accu, const any_value &elem) const {
    const any_value data = value_object{{"accumulator", std::move(accu)}, {"current", elem}};

    return ev.eval_in(exp, data);
  }

 private:
  const expr &exp;
  const evaluator &ev;
};

/// tracks the nesting depth of evaluation
struct depth_guard {
  depth_guard(std::size_t &lvl, std::size_t maxDepth)
  : level(lvl)
  {
    if (maxDepth && level >= maxDepth) {
      CXX_UNLIKELY;
      throw depth_limit_error{"maximal rule nesting depth exceeded"};
    }

    ++level;
  }

  ~depth_guard() { --level; }

 private:
  std::size_t &level;
};

any_value evaluator::eval(const expr &n) {
  depth_guard guard{level, config.max_depth};
  any_value res;

  n.accept(*this);
  res.swap(calcres);

  return res;
}

any_value evaluator::eval_in(const expr &n, const any_value &data) const {
  evaluator sub{data, config, level};

  return sub.eval(n);
}

any_value evaluator::eval_operand(const oper &n, int argpos) {
  if (argpos >= n.num_evaluated_operands()) {
    CXX_UNLIKELY;
    return nullptr;
  }

  return eval(n.operand(argpos));
}

value_array evaluator::eval_operands(const oper &n) {
  const int num = n.num_evaluated_operands();
  value_array res;

  res.reserve(num);

  for (int idx = 0; idx < num; ++idx)
    res.push_back(eval(n.operand(idx)));

  return res;
}

std::int64_t evaluator::unpack_optional_int_arg(const oper &n, int argpos,
                                                std::int64_t defaultVal) {
  if (argpos >= n.num_evaluated_operands()) {
    CXX_UNLIKELY;
    return defaultVal;
  }

  any_value val = eval(n.operand(argpos));

  if (is_null(val)) return defaultVal;

  return to_int64(val);
}

template <class unary_predicate_t>
void evaluator::unary(const oper &n, unary_predicate_t pred) {
  const bool res = pred(eval_operand(n, 0));

  calcres = res;
}

template <class binary_op_t>
void evaluator::binary(const oper &n, binary_op_t binop) {
  any_value lhs = eval_operand(n, 0);
  any_value rhs = eval_operand(n, 1);

  calcres = compute(lhs, rhs, binop);
}

template <class binary_op_t>
any_value evaluator::compute_with_dates(const any_value &lhs, const any_value &rhs,
                                        const binary_op_t &op, bool subtraction) const {
  std::optional<any_value> res =
      date_arithmetic(lhs, rhs, subtraction, deref(config.dates.get(), "no date provider"));

  if (res) return std::move(*res);

  return compute(lhs, rhs, op);
}

template <class binary_op_t>
void evaluator::reduce_sequence(const oper &n, binary_op_t op, any_value neutral) {
  const int num = n.num_evaluated_operands();

  if (num == 0) {
    CXX_UNLIKELY;
    calcres = std::move(neutral);
    return;
  }

  int idx = -1;
  any_value res = eval(n.operand(++idx));

  // a single operand is cast to a number
  if (num == 1) {
    calcres = (res.index() == date_variant || res.index() == dttm_variant) ? res : numeric_cast(res);
    return;
  }

  while (idx != (num - 1)) {
    any_value rhs = eval(n.operand(++idx));

    res = op(res, rhs);
  }

  calcres = std::move(res);
}

template <class binary_predicate_t>
void evaluator::eval_pairwise(const oper &n, binary_predicate_t pred) {
  value_array vals = eval_operands(n);

  // missing operands are null
  if (vals.size() < 2) vals.resize(2);

  bool res = true;

  for (std::size_t idx = 1; res && idx < vals.size(); ++idx)
    res = pred(vals[idx - 1], vals[idx]);

  calcres = res;
}

void evaluator::eval_short_circuit(const oper &n, bool val) {
  const int num = n.num_evaluated_operands();

  if (num == 0) {
    CXX_UNLIKELY;
    calcres = false;
    return;
  }

  int idx = -1;
  any_value tmpval = eval(n.operand(++idx));

  bool found = (idx == num - 1) || (truthy(tmpval) == val);

  // loop until *aa == val or when *aa is the last valid element
  while (!found) {
    tmpval = eval(n.operand(++idx));

    found = (idx == (num - 1)) || (truthy(tmpval) == val);
  }

  calcres = std::move(tmpval);
}

void evaluator::eval_conditional(const oper &n) {
  const int num = n.num_evaluated_operands();

  if (num == 0) {
    calcres = nullptr;
    return;
  }

  const int lim = num - 1;
  int pos = 0;

  while (pos < lim) {
    if (truthy(eval(n.operand(pos)))) {
      calcres = eval(n.operand(pos + 1));
      return;
    }

    pos += 2;
  }

  calcres = (pos < num) ? eval(n.operand(pos)) : any_value(nullptr);
}

void evaluator::visit(const equal &n) {
  eval_pairwise(n, operator_impl<equal>{});
}

void evaluator::visit(const strict_equal &n) {
  eval_pairwise(n, operator_impl<strict_equal>{});
}

void evaluator::visit(const not_equal &n) {
  eval_pairwise(n, operator_impl<not_equal>{});
}

void evaluator::visit(const strict_not_equal &n) {
  eval_pairwise(n, operator_impl<strict_not_equal>{});
}

void evaluator::visit(const less &n) {
  eval_pairwise(n, operator_impl<less>{});
}

void evaluator::visit(const greater &n) {
  eval_pairwise(n, operator_impl<greater>{});
}

void evaluator::visit(const less_or_equal &n) {
  eval_pairwise(n, operator_impl<less_or_equal>{});
}

void evaluator::visit(const greater_or_equal &n) {
  eval_pairwise(n, operator_impl<greater_or_equal>{});
}

void evaluator::visit(const logical_and &n) { eval_short_circuit(n, false); }

void evaluator::visit(const logical_or &n) { eval_short_circuit(n, true); }

void evaluator::visit(const logical_not &n) {
  unary(n, operator_impl<logical_not>{});
}

void evaluator::visit(const logical_not_not &n) {
  unary(n, operator_impl<logical_not_not>{});
}

void evaluator::visit(const if_expr &n) { eval_conditional(n); }

void evaluator::visit(const ternary &n) { eval_conditional(n); }

void evaluator::visit(const add &n) {
  auto adder = [self = this](const any_value &lhs, const any_value &rhs) -> any_value {
    return self->compute_with_dates(lhs, rhs, operator_impl<add>{}, false);
  };

  reduce_sequence(n, adder, std::int64_t(0));
}

void evaluator::visit(const subtract &n) {
  const int num = n.num_evaluated_operands();

  if (num < 2) {
    // unary minus
    any_value val = numeric_cast(eval_operand(n, 0));

    calcres = is_null(val) ? val : compute(std::int64_t(0), val, operator_impl<subtract>{});
    return;
  }

  any_value lhs = eval(n.operand(0));
  any_value rhs = eval(n.operand(1));

  calcres = compute_with_dates(lhs, rhs, operator_impl<subtract>{}, true);
}

void evaluator::visit(const multiply &n) {
  auto multiplier = [](const any_value &lhs, const any_value &rhs) -> any_value {
    return compute(lhs, rhs, operator_impl<multiply>{});
  };

  reduce_sequence(n, multiplier, std::int64_t(1));
}

void evaluator::visit(const divide &n) { binary(n, operator_impl<divide>{}); }

void evaluator::visit(const modulo &n) { binary(n, operator_impl<modulo>{}); }

void evaluator::visit(const min &n) {
  auto minimum = [](const any_value &lhs, const any_value &rhs) -> any_value {
    return compute(lhs, rhs, operator_impl<min>{});
  };

  reduce_sequence(n, minimum, nullptr);
}

void evaluator::visit(const max &n) {
  auto maximum = [](const any_value &lhs, const any_value &rhs) -> any_value {
    return compute(lhs, rhs, operator_impl<max>{});
  };

  reduce_sequence(n, maximum, nullptr);
}

void evaluator::visit(const cat &n) {
  const int num = n.num_evaluated_operands();
  std::string res;

  for (int idx = 0; idx < num; ++idx)
    res += to_string(eval(n.operand(idx)));

  calcres = std::move(res);
}

#if RULEVAL_WITH_EXTENSIONS
void evaluator::visit(const regex_match &n) {
  const std::string pattern = to_string(eval_operand(n, 0));
  const std::string subject = to_string(eval_operand(n, 1));

  try {
    std::regex rgx(pattern, std::regex::ECMAScript);

    calcres = std::regex_search(subject, rgx);
  } catch (const std::regex_error &ex) {
    throw_type_error(std::string("invalid regular expression: ") + ex.what());
  }
}

void evaluator::visit(const count &n) {
  value_array vals = eval_operands(n);

  logger << "warning: 'count' is not a core operator and may not be supported"
         << " by other implementations" << std::endl;

  calcres = std::int64_t(std::count_if(vals.begin(), vals.end(),
                                       [](const any_value &v) -> bool { return truthy(v); }));
}
#endif /* RULEVAL_WITH_EXTENSIONS */

void evaluator::visit(const membership &n) {
  // lhs in rhs - rhs is a possibly large set.
  any_value lhs = eval_operand(n, 0);
  any_value rhs = eval_operand(n, 1);

  switch (rhs.index()) {
    case strg_variant: {
      calcres = std::get<std::string>(rhs).find(to_string(lhs)) != std::string::npos;
      break;
    }

    case arry_variant: {
      const value_array &elems = *std::get<array_ptr>(rhs);
      auto isEqual = [&lhs](const any_value &el) -> bool { return strict_equals(lhs, el); };

      calcres = std::find_if(elems.begin(), elems.end(), isEqual) != elems.end();
      break;
    }

    case objt_variant: {
      const value_object &obj = *std::get<object_ptr>(rhs);

      calcres = is_string(lhs) && obj.find(std::get<std::string>(lhs)) != obj.end();
      break;
    }

    default:
      calcres = false;
  }
}

void evaluator::visit(const substr &n) {
  const std::string str = to_string(eval_operand(n, 0));
  const std::vector<std::string_view> chars = code_points(str);
  const std::int64_t len = chars.size();
  std::int64_t ofs = unpack_optional_int_arg(n, 1, 0);

  if (ofs < 0) {
    CXX_UNLIKELY;
    ofs = std::max(len + ofs, std::int64_t(0));
  }

  ofs = std::min(ofs, len);

  std::int64_t cnt = unpack_optional_int_arg(n, 2, len - ofs);

  if (cnt < 0) {
    CXX_UNLIKELY;
    cnt = std::max(len - ofs + cnt, std::int64_t(0));
  }

  cnt = std::min(cnt, len - ofs);

  std::string res;

  for (std::int64_t idx = ofs; idx < ofs + cnt; ++idx)
    res.append(chars[idx]);

  calcres = std::move(res);
}

void evaluator::visit(const array &n) {
  calcres = eval_operands(n);
}

void evaluator::visit(const merge &n) {
  value_array res;

  for (any_value &el : eval_operands(n)) {
    if (const array_ptr *arr = std::get_if<array_ptr>(&el))
      res.insert(res.end(), (*arr)->begin(), (*arr)->end());
    else
      res.push_back(std::move(el));
  }

  calcres = std::move(res);
}

const expr &evaluator::sequence_rule(const oper &n) const {
  if (n.num_evaluated_operands() < 2) {
    CXX_UNLIKELY;
    return null_rule();
  }

  return n.operand(1);
}

array_ptr evaluator::eval_sequence(const oper &n) {
  any_value arr = eval_operand(n, 0);

  if (const array_ptr *elems = std::get_if<array_ptr>(&arr)) {
    CXX_LIKELY;
    return *elems;
  }

  return nullptr;
}

void evaluator::visit(const reduce &n) {
  array_ptr elems = eval_sequence(n);
  const expr &rule = sequence_rule(n);
  any_value accu = (n.num_evaluated_operands() > 2) ? eval(n.operand(2))
                                                     : any_value(std::int64_t(0));

  if (!elems) {
    calcres = std::move(accu);
    return;
  }

  calcres = std::accumulate(elems->begin(), elems->end(), std::move(accu),
                            sequence_reduction{rule, *this});
}

void evaluator::visit(const map &n) {
  array_ptr elems = eval_sequence(n);
  value_array res;

  if (elems) {
    res.reserve(elems->size());
    std::transform(elems->begin(), elems->end(), std::back_inserter(res),
                   sequence_function{sequence_rule(n), *this});
  }

  calcres = std::move(res);
}

void evaluator::visit(const filter &n) {
  array_ptr elems = eval_sequence(n);
  value_array res;

  if (elems)
    std::copy_if(elems->begin(), elems->end(), std::back_inserter(res),
                 sequence_predicate{sequence_rule(n), *this});

  calcres = std::move(res);
}

void evaluator::visit(const all &n) {
  array_ptr elems = eval_sequence(n);

  // all of an empty set is false
  if (!elems || elems->empty()) {
    calcres = false;
    return;
  }

  calcres = std::all_of(elems->begin(), elems->end(),
                        sequence_predicate{sequence_rule(n), *this});
}

void evaluator::visit(const none &n) {
  array_ptr elems = eval_sequence(n);

  if (!elems) {
    calcres = true;
    return;
  }

  calcres = std::none_of(elems->begin(), elems->end(),
                         sequence_predicate{sequence_rule(n), *this});
}

void evaluator::visit(const some &n) {
  array_ptr elems = eval_sequence(n);

  if (!elems) {
    calcres = false;
    return;
  }

  calcres = std::any_of(elems->begin(), elems->end(),
                        sequence_predicate{sequence_rule(n), *this});
}

void evaluator::visit(const error &n) {
  throw unrecognized_operator{"unrecognized operator '" + n.name() + "'"};
}

void evaluator::visit(const var &n) {
  any_value path = eval_operand(n, 0);
  std::optional<any_value> val = eval_path(context, path);

  // the default replaces absent and null values
  if (val && !is_null(*val)) {
    CXX_LIKELY;
    calcres = std::move(*val);
    return;
  }

  calcres = eval_operand(n, 1);
}

value_array evaluator::missing_aux(const value_array &names) const {
  value_array res;

  for (const any_value &name : names) {
    std::optional<any_value> val = eval_path(context, name);

    // value-missing := absent, null, or ""
    if (!val || is_null(*val) || (is_string(*val) && std::get<std::string>(*val).empty()))
      res.push_back(name);
  }

  return res;
}

void evaluator::visit(const missing &n) {
  value_array args = eval_operands(n);

  // if the first argument is an array, only the array is considered
  if (!args.empty()) {
    if (const array_ptr *arr = std::get_if<array_ptr>(&args.front())) {
      calcres = missing_aux(**arr);
      return;
    }
  }

  calcres = missing_aux(args);
}

void evaluator::visit(const missing_some &n) {
  const std::int64_t minreq = unpack_optional_int_arg(n, 0, 0);
  any_value arr = eval_operand(n, 1);
  const array_ptr *names = std::get_if<array_ptr>(&arr);

  if (names == nullptr) {
    CXX_UNLIKELY;
    throw_type_error("missing_some expects an array of names");
  }

  value_array absent = missing_aux(**names);
  const std::int64_t avail = (*names)->size() - absent.size();

  if (avail >= minreq) absent.clear();

  calcres = std::move(absent);
}

void evaluator::visit(const today &) {
  calcres = deref(config.dates.get(), "no date provider").today();
}

void evaluator::visit(const date &n) {
  any_value val = eval_operand(n, 0);

  switch (val.index()) {
    case date_variant:
      calcres = std::move(val);
      break;

    case dttm_variant:
      calcres = std::get<ptm::ptime>(val).date();
      break;

    case strg_variant:
      calcres = deref(config.dates.get(), "no date provider").parse_date(std::get<std::string>(val));
      break;

    default:
      throw_type_error("date expects a string");
  }
}

void evaluator::visit(const datetime &n) {
  any_value val = eval_operand(n, 0);

  switch (val.index()) {
    case date_variant:
      calcres = ptm::ptime(std::get<greg::date>(val));
      break;

    case dttm_variant:
      calcres = std::move(val);
      break;

    case strg_variant:
      calcres = deref(config.dates.get(), "no date provider").parse_datetime(std::get<std::string>(val));
      break;

    default:
      throw_type_error("datetime expects a string");
  }
}

void evaluator::visit(const rdelta &n) {
  relative_delta res;

  res.years  = unpack_optional_int_arg(n, 0, 0);
  res.months = unpack_optional_int_arg(n, 1, 0);
  res.days   = unpack_optional_int_arg(n, 2, 0);

  calcres = res;
}

void evaluator::visit(const log &n) {
  calcres = eval_operand(n, 0);

  logger << calcres << std::endl;
}

void evaluator::visit(const custom_oper &n) {
  const operator_descriptor &desc = n.descriptor();

  if (desc.mode == evaluation_mode::lazy) {
    evaluate_fn evalfn = [self = this](const expr &e, const any_value &data) -> any_value {
      return self->eval_in(e, data);
    };

    calcres = desc.lazy_fn(n.operands(), context, evalfn);
    return;
  }

  value_array args = eval_operands(n);

  // missing operands of fixed arity operators are null
  if (desc.arity != operator_descriptor::variadic)
    args.resize(desc.arity, nullptr);

  calcres = desc.eager_fn(args);
}

void evaluator::visit(const value_base &n) { calcres = n.to_variant(); }

}  // namespace

//
// engine configuration

engine_config::engine_config()
: log_stream(&std::clog)
{}

const engine_config &default_config() {
  static const engine_config config;

  return config;
}

value_variant apply(const expr &exp, const value_variant &data, const engine_config &config) {
  evaluator ev{data, config};

  return ev.eval(exp);
}

value_variant apply(const any_expr &exp, const value_variant &data, const engine_config &config) {
  return apply(deref(exp, "empty syntax tree"), data, config);
}

value_variant apply(const json::value &rule, const json::value &data, const engine_config &config) {
  logic_rule logic(create_logic(rule, config.operators));

  return ruleval::apply(logic.syntax_tree(), to_value(data), config);
}

//
// rule inspection

namespace {

/// converts a syntax tree back to json
struct json_converter : forwarding_visitor {
  void visit(const expr &) final { unsupported(); }

  void visit(const oper &n) final {
    json::array args;

    for (const any_expr &el : n.operands())
      args.push_back(convert(deref(el)));

    json::object obj;

    obj[operator_name(n)] = std::move(args);
    result = std::move(obj);
  }

  void visit(const array &n) final {
    json::array elems;

    for (const any_expr &el : n.operands())
      elems.push_back(convert(deref(el)));

    result = std::move(elems);
  }

  void visit(const value_base &n) final { result = n.to_json(); }

  void visit(const error &n) final {
    const json::value &args = n.operands();
    json::object obj;

    obj[n.name()] = args.is_array() ? args : json::value(json::array{args});
    result = std::move(obj);
  }

  static json::value convert(const expr &e) {
    json_converter conv;

    e.accept(conv);
    return std::move(conv.result);
  }

  json::value result;
};

using text_lines = std::vector<std::string>;

/// renders a syntax tree as indented text
struct tree_printer : forwarding_visitor {
  void visit(const expr &) final { unsupported(); }

  void visit(const oper &n) final {
    lines.push_back("Operation(" + std::string(operator_name(n)) + ")");
    children(n.operands());
  }

  void visit(const array &n) final {
    lines.push_back("Array");
    children(n.operands());
  }

  void visit(const var &n) final {
    const value_base *path = (n.size() == 0) ? nullptr : may_down_cast<value_base>(n.operand(0));

    if (path == nullptr) {
      visit(up_cast<oper>(n));
      return;
    }

    const any_value name = path->to_variant();

    lines.push_back("$" + (is_null(name) ? std::string() : to_string(name)));
  }

  // if with more than one condition
  void visit(const if_expr &n) final {
    const int num = n.size();

    if (num <= 2) {
      visit(up_cast<oper>(n));
      return;
    }

    lines.push_back("Conditional");

    for (int i = 0; i + 1 < num; i += 2) {
      text_lines condition = render(n.operand(i));
      text_lines outcome = render(n.operand(i + 1));

      lines.push_back(i == 0 ? "  If" : "  Elif");
      indent(condition, "  ├─ ", "  │  ");
      lines.push_back("  └─ Then");
      indent(outcome, "       └─ ", "          ");
    }

    if (num % 2 == 1) {
      lines.push_back("  Else");
      indent(render(n.operand(num - 1)), "  └─ ", "     ");
    }
  }

  void visit(const value_base &n) final {
    std::stringstream os;

    os << n.to_variant();
    lines.push_back(os.str());
  }

  void visit(const error &n) final {
    lines.push_back("Operation(" + n.name() + ")");
    lines.push_back("  └─ " + json::serialize(n.operands()));
  }

  static text_lines render(const expr &e) {
    tree_printer prn;

    e.accept(prn);
    return std::move(prn.lines);
  }

  text_lines lines;

 private:
  void indent(const text_lines &sub, const std::string &first, const std::string &rest) {
    bool isFirst = true;

    for (const std::string &ln : sub) {
      lines.push_back((isFirst ? first : rest) + ln);
      isFirst = false;
    }
  }

  void children(const operand_list &opers) {
    const std::size_t num = opers.size();

    for (std::size_t i = 0; i < num; ++i) {
      const bool last = (i + 1 == num);

      indent(render(deref(opers[i])), last ? "  └─ " : "  ├─ ", last ? "     " : "  │  ");
    }
  }
};

/// returns the operands of a rule as array
json::array rule_operands(const json::object &rule) {
  const json::value &args = rule.begin()->value();

  if (const json::array *arr = args.if_array()) return *arr;

  return json::array{args};
}

}  // namespace

json::value to_json(const any_expr &e) {
  return json_converter::convert(deref(e, "empty syntax tree"));
}

std::ostream &operator<<(std::ostream &os, const any_expr &n) {
  bool first = true;

  for (const std::string &ln : tree_printer::render(deref(n, "empty syntax tree"))) {
    if (first)
      first = false;
    else
      os << '\n';

    os << ln;
  }

  return os;
}

bool is_logic(const json::value &rule) {
  const json::object *obj = rule.if_object();

  return obj && obj->size() == 1;
}

bool rule_like(const json::value &rule, const json::value &pattern) {
  if (const json::string *pat = pattern.if_string()) {
    if (*pat == "@") return true;
    if (*pat == "number") return rule.is_number();
    if (*pat == "string") return rule.is_string() || rule == pattern;
    if (*pat == "array") return rule.is_array();
  }

  if (is_logic(pattern)) {
    if (!is_logic(rule)) return false;

    const json::object &patobj = pattern.get_object();
    const json::object &ruleobj = rule.get_object();
    const json::string &patop = patobj.begin()->key();

    if (patop != "@" && patop != ruleobj.begin()->key()) return false;

    return rule_like(rule_operands(ruleobj), rule_operands(patobj));
  }

  if (const json::array *patarr = pattern.if_array()) {
    const json::array *rulearr = rule.if_array();

    if (rulearr == nullptr || rulearr->size() != patarr->size()) return false;

    for (std::size_t i = 0; i < patarr->size(); ++i)
      if (!rule_like((*rulearr)[i], (*patarr)[i])) return false;

    return true;
  }

  if (pattern.is_object()) return false;

  return rule == pattern;
}

//
// logic_rule

any_expr const &logic_rule::syntax_tree() const { return std::get<0>(*this); }

std::vector<std::string> const &logic_rule::variable_names() const {
  return std::get<1>(*this);
}

bool logic_rule::has_computed_variable_names() const {
  return std::get<2>(*this);
}

value_variant logic_rule::apply(const value_variant &data, const engine_config &config) const {
  return ruleval::apply(syntax_tree(), data, config);
}

}  // namespace ruleval
