#pragma once
// core_pch.h : include file for standard system include files,
// and the serialization macros used by all serializable core types
#if defined(_WINDOWS)
#pragma warning (disable : 4267)
#pragma warning (disable : 4244)
#pragma warning (disable : 4503)
#endif

#ifndef FIXZONE_NO_PCH
#include <string>
#include <cstdint>
#include <stdexcept>
#include <memory>
#include <iosfwd>
#endif // FIXZONE_NO_PCH

#include "core_serialization.h"
