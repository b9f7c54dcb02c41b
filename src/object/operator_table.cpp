/***
 * Name: pyhost::object operator table
 * Purpose: The single mapping from BinaryOp/UnaryOp onto CallTable entries.
 * Theory of Operation: Power is ternary in CPython; the modulus is None.
 */
#include "pyhost/object/Operators.h"

namespace pyhost::object {

const char* operatorName(BinaryOp op) noexcept {
  switch (op) {
    case BinaryOp::Add: return "+";
    case BinaryOp::Subtract: return "-";
    case BinaryOp::Multiply: return "*";
    case BinaryOp::MatrixMultiply: return "@";
    case BinaryOp::FloorDivide: return "//";
    case BinaryOp::TrueDivide: return "/";
    case BinaryOp::Remainder: return "%";
    case BinaryOp::Power: return "**";
    case BinaryOp::LeftShift: return "<<";
    case BinaryOp::RightShift: return ">>";
    case BinaryOp::And: return "&";
    case BinaryOp::Xor: return "^";
    case BinaryOp::Or: return "|";
  }
  return "?";
}

const char* operatorName(UnaryOp op) noexcept {
  switch (op) {
    case UnaryOp::Negative: return "unary -";
    case UnaryOp::Positive: return "unary +";
    case UnaryOp::Invert: return "~";
  }
  return "?";
}

namespace detail {

ffi::Handle applyBinary(const ffi::CallTable& api, BinaryOp op, ffi::Handle lhs, ffi::Handle rhs) {
  switch (op) {
    case BinaryOp::Add: return api.numberAdd(lhs, rhs);
    case BinaryOp::Subtract: return api.numberSubtract(lhs, rhs);
    case BinaryOp::Multiply: return api.numberMultiply(lhs, rhs);
    case BinaryOp::MatrixMultiply: return api.numberMatrixMultiply(lhs, rhs);
    case BinaryOp::FloorDivide: return api.numberFloorDivide(lhs, rhs);
    case BinaryOp::TrueDivide: return api.numberTrueDivide(lhs, rhs);
    case BinaryOp::Remainder: return api.numberRemainder(lhs, rhs);
    case BinaryOp::Power: return api.numberPower(lhs, rhs, api.none());
    case BinaryOp::LeftShift: return api.numberLshift(lhs, rhs);
    case BinaryOp::RightShift: return api.numberRshift(lhs, rhs);
    case BinaryOp::And: return api.numberAnd(lhs, rhs);
    case BinaryOp::Xor: return api.numberXor(lhs, rhs);
    case BinaryOp::Or: return api.numberOr(lhs, rhs);
  }
  return nullptr;
}

ffi::Handle applyInPlace(const ffi::CallTable& api, BinaryOp op, ffi::Handle lhs, ffi::Handle rhs) {
  switch (op) {
    case BinaryOp::Add: return api.numberInPlaceAdd(lhs, rhs);
    case BinaryOp::Subtract: return api.numberInPlaceSubtract(lhs, rhs);
    case BinaryOp::Multiply: return api.numberInPlaceMultiply(lhs, rhs);
    case BinaryOp::MatrixMultiply: return api.numberInPlaceMatrixMultiply(lhs, rhs);
    case BinaryOp::FloorDivide: return api.numberInPlaceFloorDivide(lhs, rhs);
    case BinaryOp::TrueDivide: return api.numberInPlaceTrueDivide(lhs, rhs);
    case BinaryOp::Remainder: return api.numberInPlaceRemainder(lhs, rhs);
    case BinaryOp::Power: return api.numberInPlacePower(lhs, rhs, api.none());
    case BinaryOp::LeftShift: return api.numberInPlaceLshift(lhs, rhs);
    case BinaryOp::RightShift: return api.numberInPlaceRshift(lhs, rhs);
    case BinaryOp::And: return api.numberInPlaceAnd(lhs, rhs);
    case BinaryOp::Xor: return api.numberInPlaceXor(lhs, rhs);
    case BinaryOp::Or: return api.numberInPlaceOr(lhs, rhs);
  }
  return nullptr;
}

ffi::Handle applyUnary(const ffi::CallTable& api, UnaryOp op, ffi::Handle operand) {
  switch (op) {
    case UnaryOp::Negative: return api.numberNegative(operand);
    case UnaryOp::Positive: return api.numberPositive(operand);
    case UnaryOp::Invert: return api.numberInvert(operand);
  }
  return nullptr;
}

} // namespace detail

} // namespace pyhost::object
