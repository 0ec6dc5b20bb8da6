/// implements the operator registry

#include "ruleval/operators.hpp"

// standard headers
#include <algorithm>
#include <stdexcept>

#include "ruleval/details/cxx-compat.hpp"

namespace ruleval {

namespace {

constexpr evaluation_mode eager = evaluation_mode::eager;
constexpr evaluation_mode lazy  = evaluation_mode::lazy;

constexpr bool OVERRIDABLE = true;
constexpr bool PROTECTED   = false;

}  // namespace

const std::vector<builtin_descriptor> &operator_registry::builtins() {
  // operators that control evaluation or the data context are protected
  static const std::vector<builtin_descriptor> table = {
      {"==",           builtin_op::equal,            eager, OVERRIDABLE},
      {"===",          builtin_op::strict_equal,     eager, OVERRIDABLE},
      {"!=",           builtin_op::not_equal,        eager, OVERRIDABLE},
      {"!==",          builtin_op::strict_not_equal, eager, OVERRIDABLE},
      {"<",            builtin_op::less,             eager, OVERRIDABLE},
      {">",            builtin_op::greater,          eager, OVERRIDABLE},
      {"<=",           builtin_op::less_or_equal,    eager, OVERRIDABLE},
      {">=",           builtin_op::greater_or_equal, eager, OVERRIDABLE},
      {"!",            builtin_op::logical_not,      eager, OVERRIDABLE},
      {"!!",           builtin_op::logical_not_not,  eager, OVERRIDABLE},
      {"and",          builtin_op::logical_and,      lazy,  PROTECTED},
      {"or",           builtin_op::logical_or,       lazy,  PROTECTED},
      {"if",           builtin_op::if_expr,          lazy,  PROTECTED},
      {"?:",           builtin_op::ternary,          lazy,  PROTECTED},
      {"+",            builtin_op::add,              eager, OVERRIDABLE},
      {"-",            builtin_op::subtract,         eager, OVERRIDABLE},
      {"*",            builtin_op::multiply,         eager, OVERRIDABLE},
      {"/",            builtin_op::divide,           eager, OVERRIDABLE},
      {"%",            builtin_op::modulo,           eager, OVERRIDABLE},
      {"min",          builtin_op::min,              eager, OVERRIDABLE},
      {"max",          builtin_op::max,              eager, OVERRIDABLE},
      {"in",           builtin_op::membership,       eager, OVERRIDABLE},
      {"cat",          builtin_op::cat,              eager, OVERRIDABLE},
      {"substr",       builtin_op::substr,           eager, OVERRIDABLE},
      {"merge",        builtin_op::merge,            eager, OVERRIDABLE},
      {"map",          builtin_op::map,              lazy,  PROTECTED},
      {"filter",       builtin_op::filter,           lazy,  PROTECTED},
      {"reduce",       builtin_op::reduce,           lazy,  PROTECTED},
      {"all",          builtin_op::all,              lazy,  PROTECTED},
      {"none",         builtin_op::none,             lazy,  PROTECTED},
      {"some",         builtin_op::some,             lazy,  PROTECTED},
      {"var",          builtin_op::var,              lazy,  PROTECTED},
      {"missing",      builtin_op::missing,          eager, PROTECTED},
      {"missing_some", builtin_op::missing_some,     eager, PROTECTED},
      {"today",        builtin_op::today,            eager, OVERRIDABLE},
      {"date",         builtin_op::date,             eager, OVERRIDABLE},
      {"datetime",     builtin_op::datetime,         eager, OVERRIDABLE},
      {"rdelta",       builtin_op::rdelta,           eager, OVERRIDABLE},
      {"log",          builtin_op::log,              eager, OVERRIDABLE},
#if RULEVAL_WITH_EXTENSIONS
      // extensions
      {"count",        builtin_op::count,            eager, OVERRIDABLE},
      {"regex",        builtin_op::regex_match,      eager, OVERRIDABLE},
#endif /* RULEVAL_WITH_EXTENSIONS */
  };

  return table;
}

const builtin_descriptor &operator_registry::builtin(builtin_op op) {
  const std::vector<builtin_descriptor> &table = builtins();
  auto pos = std::find_if(table.begin(), table.end(),
                          [op](const builtin_descriptor &el) -> bool { return el.op == op; });

  if (pos == table.end()) {
    CXX_UNLIKELY;
    throw std::logic_error{"operators.cc: builtin operator without descriptor"};
  }

  return *pos;
}

const operator_registry &operator_registry::standard() {
  static const operator_registry registry;

  return registry;
}

operator_descriptor operator_descriptor::eager(eager_function fn, int arity) {
  operator_descriptor res;

  res.arity = arity;
  res.mode = evaluation_mode::eager;
  res.eager_fn = std::move(fn);
  return res;
}

operator_descriptor operator_descriptor::lazy(lazy_function fn, int arity) {
  operator_descriptor res;

  res.arity = arity;
  res.mode = evaluation_mode::lazy;
  res.lazy_fn = std::move(fn);
  return res;
}

operator_registry &operator_registry::add_operator(std::string name, operator_descriptor desc) {
  if (name.empty())
    throw std::invalid_argument{"operator name must not be empty"};

  const bool hasFunction = (desc.mode == evaluation_mode::eager) ? bool(desc.eager_fn)
                                                                 : bool(desc.lazy_fn);

  if (!hasFunction)
    throw std::invalid_argument{"operator " + name + " has no function for its evaluation mode"};

  if (desc.arity < operator_descriptor::variadic)
    throw std::invalid_argument{"operator " + name + " has an invalid arity"};

  custom_ops[std::move(name)] = std::make_shared<const operator_descriptor>(std::move(desc));
  return *this;
}

bool operator_registry::rm_operator(std::string_view name) {
  auto pos = custom_ops.find(name);

  if (pos == custom_ops.end()) return false;

  custom_ops.erase(pos);
  return true;
}

operator_registry::entry operator_registry::lookup(std::string_view name) const {
  const std::vector<builtin_descriptor> &table = builtins();
  auto builtinPos = std::find_if(table.begin(), table.end(),
                                 [name](const builtin_descriptor &el) -> bool { return el.name == name; });

  if (builtinPos != table.end() && !builtinPos->overridable)
    return {&*builtinPos, nullptr};

  if (auto pos = custom_ops.find(name); pos != custom_ops.end())
    return {nullptr, pos->second};

  if (builtinPos != table.end())
    return {&*builtinPos, nullptr};

  return {};
}

bool operator_registry::contains(std::string_view name) const {
  return lookup(name).found();
}

std::vector<std::string> operator_registry::names() const {
  std::vector<std::string> res;

  for (const builtin_descriptor &el : builtins())
    res.emplace_back(el.name);

  for (const custom_table::value_type &el : custom_ops)
    res.push_back(el.first);

  std::sort(res.begin(), res.end());
  res.erase(std::unique(res.begin(), res.end()), res.end());
  return res;
}

} // namespace ruleval
