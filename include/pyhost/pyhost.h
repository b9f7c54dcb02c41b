/***
 * Name: pyhost umbrella header
 * Purpose: Everything a host program needs to work with Python objects.
 */
#pragma once

#include "pyhost/Bridge.h"
#include "pyhost/coerce/Containers.h"
#include "pyhost/coerce/Range.h"
#include "pyhost/coerce/ToForeign.h"
#include "pyhost/exceptions/config_error.h"
#include "pyhost/exceptions/foreign_error.h"
#include "pyhost/exceptions/invariant_violation.h"
#include "pyhost/exceptions/usage_error.h"
#include "pyhost/interp/Interpreter.h"
#include "pyhost/object/ForeignIterator.h"
#include "pyhost/object/Operators.h"
#include "pyhost/object/ProxyObject.h"
