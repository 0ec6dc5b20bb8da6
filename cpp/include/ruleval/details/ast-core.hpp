
#pragma once

#include <memory>
#include <iosfwd>
#include <vector>

namespace ruleval {

struct visitor;

// the root class
struct expr {
  expr() = default;
  virtual ~expr() = default;

  virtual void accept(visitor &) const = 0;

private:
  expr(expr &&) = delete;
  expr(const expr &) = delete;
  expr &operator=(expr &&) = delete;
  expr &operator=(const expr &) = delete;
};

using any_expr = std::unique_ptr<expr>;

/// the operands of an operator node
using operand_list = std::vector<any_expr>;

/// prints the syntax tree \p n, one node per line
std::ostream &operator<<(std::ostream &os, const any_expr &n);

} // namespace ruleval
