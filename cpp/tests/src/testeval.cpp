#include <algorithm>
#include <memory>

#include <boost/json.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

#include "ruleval/logic.hpp"

namespace bjsn = boost::json;

bjsn::value parseStream(std::istream &inps) {
  bjsn::stream_parser p;
  std::string line;

  while (std::getline(inps, line)) {
    std::error_code ec;

    line.push_back('\n');
    p.write(line.c_str(), line.size(), ec);

    if (ec) return nullptr;
  }

  std::error_code ec;
  p.finish(ec);
  if (ec) return nullptr;

  return p.release();
}

bjsn::value parseFile(const std::string &filename) {
  std::ifstream is{filename};

  if (!is) throw std::runtime_error{"unable to open " + filename};

  return parseStream(is);
}

template <class N, class T>
bool matchOpt1(const std::vector<std::string> &args, N &pos, std::string opt,
               T &fld) {
  std::string arg(args.at(pos));

  if (arg.find(opt) != 0) return false;

  ++pos;
  fld = boost::lexical_cast<T>(args.at(pos));
  ++pos;
  return true;
}

template <class N, class Fn>
bool matchOpt0(const std::vector<std::string> &args, N &pos, std::string opt,
               Fn fn) {
  std::string arg(args.at(pos));

  if (arg != opt) return false;

  fn();
  ++pos;
  return true;
}

template <class N, class Fn>
bool noSwitch0(const std::vector<std::string> &args, N &pos, Fn fn) {
  if (fn(args[pos])) {
    ++pos;
    return true;
  }

  std::cerr << "unrecognized argument: " << args[pos] << std::endl;
  ++pos;
  return false;
}

bool endsWith(const std::string &str, const std::string &suffix) {
  return (str.size() >= suffix.size() &&
          std::equal(suffix.rbegin(), suffix.rend(), str.rbegin()));
}

struct settings {
  bool verbose = false;
  bool generate_expected = false;
  std::size_t max_depth = 0;
  std::string today = {};
  std::string filename = {};
};

/// date provider with a fixed current date, so that tests
///   using today are reproducible.
struct fixed_date_provider : ruleval::gregorian_date_provider {
  explicit fixed_date_provider(boost::gregorian::date d)
  : ruleval::gregorian_date_provider(), day(d)
  {}

  boost::gregorian::date today() const override { return day; }

 private:
  boost::gregorian::date day;
};

/// returns the name of the error category of \p ex
std::string error_kind(const std::exception &ex) {
  if (dynamic_cast<const ruleval::unrecognized_operator *>(&ex))
    return "unrecognized_operator";
  if (dynamic_cast<const ruleval::type_error *>(&ex)) return "type_error";
  if (dynamic_cast<const ruleval::date_error *>(&ex)) return "date_error";
  if (dynamic_cast<const ruleval::depth_limit_error *>(&ex))
    return "depth_limit_error";

  return "other";
}

/// tests whether an exception of kind \p kind satisfies \p expected
/// \details
///    expected is either true (any error) or the name of the error kind.
bool errorMatches(const bjsn::value &expected, const std::string &kind) {
  if (expected.is_bool()) return expected.get_bool();

  return expected.is_string() && expected.get_string() == kind;
}

/// runs a single test case
/// \param  testcase an object with the fields rule, data, and one of
///         expected or error.
/// \return 0 if the test passed, 1 otherwise
int runTest(const settings &config, const ruleval::engine_config &engine,
            bjsn::object &testcase) {
  bjsn::value rule = testcase["rule"];
  bjsn::value dat;
  const bool hasExpected = testcase.contains("expected");
  const bool hasError = testcase.contains("error");
  int errorCode = 0;

  if (testcase.contains("data"))
    dat = testcase["data"];
  else
    dat.emplace_object();

  try {
    ruleval::value_variant res = ruleval::apply(rule, dat, engine);
    bjsn::value resjson = ruleval::to_json(res);

    if (config.verbose) std::cerr << res << std::endl;

    if (config.generate_expected) {
      testcase["expected"] = resjson;
      testcase.erase("error");
    } else if (hasExpected) {
      // numbers compare by value, e.g., 2 and 2.0
      errorCode = ruleval::to_value(testcase["expected"]) != ruleval::to_value(resjson);

      if (errorCode)
        std::cerr << "test failed: " << rule
                  << "\n  exp: " << testcase["expected"]
                  << "\n  got: " << resjson << std::endl;
    } else {
      errorCode = 1;

      std::cerr << "unexpected completion: " << rule
                << "\n  got: " << resjson << std::endl;
    }
  } catch (const std::exception &ex) {
    const std::string kind = error_kind(ex);

    if (config.verbose) std::cerr << "caught error: " << ex.what() << std::endl;

    if (config.generate_expected) {
      testcase.erase("expected");
      testcase["error"] = kind;
    } else if (!hasError || !errorMatches(testcase["error"], kind)) {
      errorCode = 1;

      std::cerr << "test failed: " << rule << "\n  unexpected " << kind
                << ": " << ex.what() << std::endl;
    }
  }

  return errorCode;
}

/// converts a test entry [rule, data, expected] to an object
bjsn::object testObject(const bjsn::array &entry) {
  bjsn::object res;

  if (entry.size() > 0) res["rule"] = entry[0];
  if (entry.size() > 1) res["data"] = entry[1];
  if (entry.size() > 2) res["expected"] = entry[2];

  return res;
}

int main(int argc, const char **argv) {
  constexpr bool MATCH = false;

  int errorCode = 0;
  settings config;
  std::vector<std::string> arguments(argv, argv + argc);
  size_t argn = 1;

  auto setVerbose = [&config]() -> void { config.verbose = true; };
  auto setResult = [&config]() -> void { config.generate_expected = true; };
  auto setFile = [&config](const std::string &name) -> bool {
    const bool jsonFile = endsWith(name, ".json");

    if (jsonFile) config.filename = name;

    return jsonFile;
  };

  while (argn < arguments.size()) {
    // clang-format off
    MATCH
    || matchOpt0(arguments, argn, "-v", setVerbose)
    || matchOpt0(arguments, argn, "--verbose", setVerbose)
    || matchOpt0(arguments, argn, "-r", setResult)
    || matchOpt0(arguments, argn, "--result", setResult)
    || matchOpt1(arguments, argn, "--max-depth", config.max_depth)
    || matchOpt1(arguments, argn, "--today", config.today)
    || noSwitch0(arguments, argn, setFile)
    ;
    // clang-format on
  }

  ruleval::engine_config engine;

  engine.max_depth = config.max_depth;

  if (config.today.size())
    engine.dates = std::make_shared<const fixed_date_provider>(
        boost::gregorian::from_simple_string(config.today));

  // log output is checked by testapi
  std::stringstream logs;

  if (!config.verbose) engine.log_stream = &logs;

  bjsn::value all = config.filename.size() ? parseFile(config.filename)
                                           : parseStream(std::cin);

  if (bjsn::object *testcase = all.if_object()) {
    errorCode = runTest(config, engine, *testcase);
  } else if (bjsn::array *testsuite = all.if_array()) {
    int numTests = 0;

    for (bjsn::value &entry : *testsuite) {
      // strings are section comments
      if (entry.is_string()) {
        if (config.verbose) std::cerr << "# " << entry.get_string() << std::endl;

        continue;
      }

      if (bjsn::array *triple = entry.if_array()) {
        bjsn::object testcase = testObject(*triple);

        errorCode += runTest(config, engine, testcase);

        if (config.generate_expected)
          entry = bjsn::array{testcase["rule"], testcase["data"], testcase["expected"]};
      } else {
        errorCode += runTest(config, engine, entry.as_object());
      }

      ++numTests;
    }

    if (config.verbose)
      std::cerr << numTests << " tests, " << errorCode << " failed" << std::endl;
  } else {
    std::cerr << "invalid test input" << std::endl;
    errorCode = 1;
  }

  if (config.generate_expected) std::cout << all << std::endl;

  if (config.verbose && errorCode)
    std::cerr << "errorCode: " << errorCode << std::endl;

  return errorCode;
}
