#include <algorithm>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/json.hpp>

#include "ruleval/logic.hpp"

namespace bjsn = boost::json;

namespace {

int errorCode = 0;

void check(bool cond, const std::string &testname) {
  if (cond) return;

  std::cerr << "test failed: " << testname << std::endl;
  ++errorCode;
}

template <class Error, class Fn>
void checkThrows(Fn fn, const std::string &testname) {
  try {
    fn();
  } catch (const Error &) {
    return;
  } catch (const std::exception &ex) {
    std::cerr << "test failed: " << testname << "\n  unexpected exception: "
              << ex.what() << std::endl;
    ++errorCode;
    return;
  }

  std::cerr << "test failed: " << testname << "\n  no exception" << std::endl;
  ++errorCode;
}

ruleval::value_variant eval(const std::string &rule, const std::string &data,
                            const ruleval::engine_config &config = ruleval::default_config()) {
  return ruleval::apply(bjsn::parse(rule), bjsn::parse(data), config);
}

struct fixed_date_provider : ruleval::gregorian_date_provider {
  explicit fixed_date_provider(boost::gregorian::date d)
  : ruleval::gregorian_date_provider(), day(d)
  {}

  boost::gregorian::date today() const override { return day; }

 private:
  boost::gregorian::date day;
};

void testCustomOperators() {
  ruleval::engine_config config;

  config.operators.add_operator(
      "plus_one",
      ruleval::operator_descriptor::eager(
          [](const std::vector<ruleval::value_variant> &args) -> ruleval::value_variant {
            if (ruleval::is_null(args.at(0))) return nullptr;

            return ruleval::to_double(args.at(0)) + 1;
          },
          1));

  check(eval(R"({"plus_one":[41]})", "{}", config) == 42, "custom eager operator");
  check(ruleval::is_null(eval(R"({"plus_one":[]})", "{}", config)),
        "custom operator receives null for missing operands");

  // the default configuration is not affected
  checkThrows<ruleval::unrecognized_operator>(
      []() { eval(R"({"plus_one":[41]})", "{}"); },
      "custom operator is local to its registry");

  // overriding a built-in
  config.operators.add_operator(
      "+",
      ruleval::operator_descriptor::eager(
          [](const std::vector<ruleval::value_variant> &) -> ruleval::value_variant {
            return "overridden";
          }));

  check(eval(R"({"+":[1,2]})", "{}", config) == "overridden", "custom operator overrides built-in");
  check(config.operators.rm_operator("+"), "rm_operator removes the override");
  check(eval(R"({"+":[1,2]})", "{}", config) == 3, "built-in is restored");
  check(!config.operators.rm_operator("+"), "rm_operator of a built-in has no effect");

  // protected built-ins
  config.operators.add_operator(
      "var",
      ruleval::operator_descriptor::eager(
          [](const std::vector<ruleval::value_variant> &) -> ruleval::value_variant {
            return "hijacked";
          }));

  check(eval(R"({"var":"a"})", R"({"a":7})", config) == 7, "var cannot be overridden");
  check(config.operators.lookup("var").builtin != nullptr, "lookup of a protected built-in");

  // lazy operator, evaluates operands on demand
  config.operators.add_operator(
      "first_truthy",
      ruleval::operator_descriptor::lazy(
          [](const ruleval::operand_list &opers, const ruleval::value_variant &data,
             const ruleval::evaluate_fn &evalfn) -> ruleval::value_variant {
            for (const ruleval::any_expr &op : opers) {
              ruleval::value_variant val = evalfn(*op, data);

              if (ruleval::truthy(val)) return val;
            }

            return nullptr;
          }));

  check(eval(R"({"first_truthy":[0,"",{"var":"a"},{"fubar":1}]})", R"({"a":"x"})", config) == "x",
        "lazy custom operator");

  const std::vector<std::string> names = config.operators.names();

  check(std::find(names.begin(), names.end(), "first_truthy") != names.end(), "names lists custom operators");
  check(std::find(names.begin(), names.end(), "missing_some") != names.end(), "names lists built-in operators");
  check(config.operators.contains("plus_one") && !config.operators.contains("fubar"), "contains");

  checkThrows<std::invalid_argument>(
      [&config]() { config.operators.add_operator("", ruleval::operator_descriptor::eager(nullptr)); },
      "invalid operator registration");
}

void testConfiguration() {
  std::stringstream logs;
  ruleval::engine_config config;

  config.log_stream = &logs;

  check(eval(R"({"log":"apple"})", "{}", config) == "apple", "log returns its argument");
  check(logs.str() == "\"apple\"\n", "log writes to the log stream");

  config.dates = std::make_shared<const fixed_date_provider>(boost::gregorian::date(2021, 10, 1));

  check(eval(R"({"today":[]})", "{}", config) == ruleval::value_variant(boost::gregorian::date(2021, 10, 1)),
        "today uses the date provider");

  // 5 nested operators and a literal
  const std::string deep = R"({"+":[{"+":[{"+":[{"+":[{"+":[1]}]}]}]}]})";

  config.max_depth = 3;
  checkThrows<ruleval::depth_limit_error>([&]() { eval(deep, "{}", config); }, "depth guard");

  config.max_depth = 6;
  check(eval(deep, "{}", config) == 1, "depth guard admits shallow rules");

  config.log_stream = nullptr;
  checkThrows<std::invalid_argument>([&]() { eval(R"({"log":1})", "{}", config); }, "missing log stream");
}

void testLogicRule() {
  ruleval::logic_rule rule =
      ruleval::create_logic(bjsn::parse(R"({"+":[{"var":"a"},{"var":["b",2]},3,{"var":["c"]},{"var":"a"}]})"));

  check(rule.variable_names() == std::vector<std::string>{"a", "b", "c"}, "variable names");
  check(!rule.has_computed_variable_names(), "no computed names");

  ruleval::value_variant data = ruleval::to_value(bjsn::parse(R"({"a":1,"c":4})"));
  const ruleval::value_variant copy = data;

  check(rule.apply(data) == 11, "logic_rule::apply");
  check(rule.apply(data) == 11, "repeated evaluation");
  check(data == copy, "data is not modified");

  ruleval::logic_rule computed =
      ruleval::create_logic(bjsn::parse(R"({"var":{"cat":["a","b"]}})"));

  check(computed.has_computed_variable_names(), "computed names");

  ruleval::logic_rule missing = ruleval::create_logic(bjsn::parse(R"({"missing":["x"]})"));

  check(missing.has_computed_variable_names(), "missing accesses computed names");

  ruleval::logic_rule scoped =
      ruleval::create_logic(bjsn::parse(R"({"map":[{"var":"list"},{"*":[{"var":"x"},2]}]})"));

  check(scoped.variable_names() == std::vector<std::string>{"list"}, "names inside map refer to elements");

  // unknown operators fail only when evaluated
  ruleval::logic_rule unknown =
      ruleval::create_logic(bjsn::parse(R"({"if":[{"var":"ok"},"fine",{"fubar":[]}]})"));

  check(unknown.apply(ruleval::to_value(bjsn::parse(R"({"ok":true})"))) == "fine",
        "unevaluated unknown operator");
  checkThrows<ruleval::unrecognized_operator>(
      [&unknown]() { unknown.apply(ruleval::value_variant()); },
      "evaluated unknown operator");
}

void testInspection() {
  check(ruleval::is_logic(bjsn::parse(R"({"==":[1,1]})")), "is_logic of a rule");
  check(!ruleval::is_logic(bjsn::parse(R"({"a":1,"b":2})")), "is_logic of a data object");
  check(!ruleval::is_logic(bjsn::parse(R"([1])")), "is_logic of an array");
  check(!ruleval::is_logic(bjsn::parse(R"("a")")), "is_logic of a string");

  check(ruleval::rule_like(bjsn::parse(R"({"==":[1,1]})"), bjsn::parse(R"({"==":["@","@"]})")), "rule_like with wildcards");
  check(ruleval::rule_like(bjsn::parse(R"({"==":[1,1]})"), bjsn::parse(R"({"@":["number","number"]})")), "rule_like with operator wildcard");
  check(!ruleval::rule_like(bjsn::parse(R"({"==":[1,1]})"), bjsn::parse(R"({"!=":["@","@"]})")), "rule_like with other operator");
  check(ruleval::rule_like(bjsn::parse(R"({"var":"a"})"), bjsn::parse(R"({"var":["string"]})")), "rule_like normalizes unary operands");
  check(!ruleval::rule_like(bjsn::parse(R"({"var":"a"})"), bjsn::parse(R"({"var":["number"]})")), "rule_like type mismatch");
  check(ruleval::rule_like(bjsn::parse(R"([1,[2]])"), bjsn::parse(R"(["number","array"])")), "rule_like of arrays");
  check(!ruleval::rule_like(bjsn::parse(R"([1,2])"), bjsn::parse(R"(["number"])")), "rule_like array length");
  check(ruleval::rule_like(bjsn::parse(R"({"<":[{"var":"a"},5]})"), bjsn::parse(R"({"<":[{"var":"@"},"number"]})")), "rule_like nested");
  check(ruleval::rule_like(bjsn::parse("5"), bjsn::parse("5")), "rule_like of equal values");

  ruleval::logic_rule rule = ruleval::create_logic(bjsn::parse(R"({"==":[{"+":[10,5]},15]})"));
  std::stringstream tree;

  tree << rule.syntax_tree();

  const std::string expected = "Operation(==)\n"
                               "  ├─ Operation(+)\n"
                               "  │    ├─ 10\n"
                               "  │    └─ 5\n"
                               "  └─ 15";

  check(tree.str() == expected, "tree printing");

  ruleval::logic_rule var = ruleval::create_logic(bjsn::parse(R"({"!":{"var":"x"}})"));
  std::stringstream vartree;

  vartree << var.syntax_tree();
  check(vartree.str() == "Operation(!)\n  └─ $x", "variables print by name");

  ruleval::logic_rule cond = ruleval::create_logic(bjsn::parse(
      R"({"if":[{"<":[{"var":"temp"},0]},"freezing",{"<":[{"var":"temp"},100]},"liquid","gas"]})"));
  std::stringstream condtree;

  condtree << cond.syntax_tree();

  const std::string condexpected = "Conditional\n"
                                   "  If\n"
                                   "  ├─ Operation(<)\n"
                                   "  │    ├─ $temp\n"
                                   "  │    └─ 0\n"
                                   "  └─ Then\n"
                                   "       └─ \"freezing\"\n"
                                   "  Elif\n"
                                   "  ├─ Operation(<)\n"
                                   "  │    ├─ $temp\n"
                                   "  │    └─ 100\n"
                                   "  └─ Then\n"
                                   "       └─ \"liquid\"\n"
                                   "  Else\n"
                                   "  └─ \"gas\"";

  check(condtree.str() == condexpected, "conditional tree printing");

  ruleval::logic_rule twoway = ruleval::create_logic(bjsn::parse(R"({"if":[true,1]})"));
  std::stringstream twowaytree;

  twowaytree << twoway.syntax_tree();
  check(twowaytree.str() == "Operation(if)\n  ├─ true\n  └─ 1", "if without alternative prints as operation");

  ruleval::logic_rule normalized =
      ruleval::create_logic(bjsn::parse(R"({"and":[{"var":"a"},{"cat":"x"},[1,null],{"k":1,"l":2}]})"));

  check(ruleval::to_json(normalized.syntax_tree()) ==
            bjsn::parse(R"({"and":[{"var":["a"]},{"cat":["x"]},[1,null],{"k":1,"l":2}]})"),
        "to_json normalizes operands");
}

}  // namespace

int main() {
  try {
    testCustomOperators();
    testConfiguration();
    testLogicRule();
    testInspection();
  } catch (const std::exception &ex) {
    std::cerr << "caught error: " << ex.what() << std::endl;
    ++errorCode;
  }

  if (errorCode) std::cerr << "errorCode: " << errorCode << std::endl;

  return errorCode;
}
