/***
 * Name: pyhost::object operator kinds
 * Purpose: Tagged operator set dispatched through one table onto the CPython
 *   number protocol.
 * Theory of Operation: Each BinaryOp has a plain and an in-place entry point;
 *   Power passes None as the modulus. All entry points return `new` handles.
 */
#pragma once

#include "pyhost/ffi/CallTable.h"

namespace pyhost::object {

enum class BinaryOp {
  Add,
  Subtract,
  Multiply,
  MatrixMultiply,
  FloorDivide,
  TrueDivide,
  Remainder,
  Power,
  LeftShift,
  RightShift,
  And,
  Xor,
  Or
};

enum class UnaryOp { Negative, Positive, Invert };

const char* operatorName(BinaryOp op) noexcept;
const char* operatorName(UnaryOp op) noexcept;

namespace detail {

ffi::Handle applyBinary(const ffi::CallTable& api, BinaryOp op, ffi::Handle lhs, ffi::Handle rhs);
ffi::Handle applyInPlace(const ffi::CallTable& api, BinaryOp op, ffi::Handle lhs, ffi::Handle rhs);
ffi::Handle applyUnary(const ffi::CallTable& api, UnaryOp op, ffi::Handle operand);

} // namespace detail

} // namespace pyhost::object
