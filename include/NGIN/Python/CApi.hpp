// CApi.hpp
// Single inclusion point for the CPython C API
#pragma once

#ifndef PY_SSIZE_T_CLEAN
  #define PY_SSIZE_T_CLEAN
#endif
#include <Python.h>
