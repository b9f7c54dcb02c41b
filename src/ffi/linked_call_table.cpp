/***
 * Name: pyhost::ffi::linkedCallTable
 * Purpose: Bind the CallTable to the CPython library linked into this binary.
 * Inputs: none
 * Outputs: Reference to a process-lifetime, immutable table
 * Theory of Operation: Built once on first use (thread-safe static init). Only
 *   addresses are taken here; no entry point is invoked, so the table may be
 *   obtained before the interpreter is initialized.
 */
#include "pyhost/ffi/CallTable.h"

namespace pyhost::ffi {

static CallTable bindLinked() {
  CallTable t{};
  t.incRef = &Py_IncRef;
  t.decRef = &Py_DecRef;

  t.errOccurred = &PyErr_Occurred;
  t.errFetch = &PyErr_Fetch;
  t.errNormalize = &PyErr_NormalizeException;

  t.getAttrString = &PyObject_GetAttrString;
  t.setAttrString = &PyObject_SetAttrString;
  t.getItem = &PyObject_GetItem;
  t.setItem = &PyObject_SetItem;
  t.richCompareBool = &PyObject_RichCompareBool;
  t.str = &PyObject_Str;
  t.repr = &PyObject_Repr;
  t.hash = &PyObject_Hash;
  t.isTrue = &PyObject_IsTrue;
  t.getIter = &PyObject_GetIter;
  t.call = &PyObject_Call;
  t.vectorcall = &PyObject_Vectorcall;
  t.vectorcallMethod = &PyObject_VectorcallMethod;
  t.callableCheck = &PyCallable_Check;

  t.numberAdd = &PyNumber_Add;
  t.numberSubtract = &PyNumber_Subtract;
  t.numberMultiply = &PyNumber_Multiply;
  t.numberMatrixMultiply = &PyNumber_MatrixMultiply;
  t.numberFloorDivide = &PyNumber_FloorDivide;
  t.numberTrueDivide = &PyNumber_TrueDivide;
  t.numberRemainder = &PyNumber_Remainder;
  t.numberPower = &PyNumber_Power;
  t.numberLshift = &PyNumber_Lshift;
  t.numberRshift = &PyNumber_Rshift;
  t.numberAnd = &PyNumber_And;
  t.numberXor = &PyNumber_Xor;
  t.numberOr = &PyNumber_Or;

  t.numberInPlaceAdd = &PyNumber_InPlaceAdd;
  t.numberInPlaceSubtract = &PyNumber_InPlaceSubtract;
  t.numberInPlaceMultiply = &PyNumber_InPlaceMultiply;
  t.numberInPlaceMatrixMultiply = &PyNumber_InPlaceMatrixMultiply;
  t.numberInPlaceFloorDivide = &PyNumber_InPlaceFloorDivide;
  t.numberInPlaceTrueDivide = &PyNumber_InPlaceTrueDivide;
  t.numberInPlaceRemainder = &PyNumber_InPlaceRemainder;
  t.numberInPlacePower = &PyNumber_InPlacePower;
  t.numberInPlaceLshift = &PyNumber_InPlaceLshift;
  t.numberInPlaceRshift = &PyNumber_InPlaceRshift;
  t.numberInPlaceAnd = &PyNumber_InPlaceAnd;
  t.numberInPlaceXor = &PyNumber_InPlaceXor;
  t.numberInPlaceOr = &PyNumber_InPlaceOr;

  t.numberNegative = &PyNumber_Negative;
  t.numberPositive = &PyNumber_Positive;
  t.numberInvert = &PyNumber_Invert;

  t.sequenceGetItem = &PySequence_GetItem;
  t.mappingItems = &PyMapping_Items;
  t.iterNext = &PyIter_Next;

  t.longFromLongLong = &PyLong_FromLongLong;
  t.longFromUnsignedLongLong = &PyLong_FromUnsignedLongLong;
  t.longAsLongLong = &PyLong_AsLongLong;
  t.boolFromLong = &PyBool_FromLong;
  t.floatFromDouble = &PyFloat_FromDouble;
  t.floatAsDouble = &PyFloat_AsDouble;
  t.unicodeFromStringAndSize = &PyUnicode_FromStringAndSize;
  t.unicodeAsUTF8AndSize = &PyUnicode_AsUTF8AndSize;
  t.tupleNew = &PyTuple_New;
  t.tupleSetItem = &PyTuple_SetItem;
  t.listNew = &PyList_New;
  t.listSetItem = &PyList_SetItem;
  t.dictNew = &PyDict_New;
  t.dictSetItem = &PyDict_SetItem;
  t.setNew = &PySet_New;
  t.setAdd = &PySet_Add;
  t.sliceNew = &PySlice_New;
  t.none = []() -> Handle { return Py_None; };

  t.importModule = &PyImport_ImportModule;
  t.evalGetBuiltins = &PyEval_GetBuiltins;
  t.runSimpleString = &PyRun_SimpleStringFlags;
  t.isInitialized = &Py_IsInitialized;
  return t;
}

const CallTable& linkedCallTable() {
  static const CallTable table = bindLinked();
  return table;
}

const char* linkedLibraryName() {
  return "python" Py_STRINGIFY(PY_MAJOR_VERSION) "." Py_STRINGIFY(PY_MINOR_VERSION);
}

}  // namespace pyhost::ffi
