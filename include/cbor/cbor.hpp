#pragma once

/// @file cbor.hpp
/// @brief Main header file for the yacbor library.
///
/// @code
///   yacbor::Container root;
///   root.put("name", "test.txt");
///   root.put("size", 451);
///   std::vector<uint8_t> bytes = yacbor::encode(yacbor::Value(std::move(root)));
/// @endcode

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "allocator.hpp"
#include "arena.hpp"
#include "container.hpp"
#include "value.hpp"
#include "encoder.hpp"
