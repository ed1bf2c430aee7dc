/// @file treedelta.hpp
/// @brief Umbrella header for the treedelta-cpp library.
///
/// Include this single header for access to all public types and
/// operations: Value, Path, Operation, ChangeList, diff, apply, optimize,
/// merge, invert, checksum, and Error.

#pragma once

#include <treedelta-cpp/change_list.hpp>
#include <treedelta-cpp/checksum.hpp>
#include <treedelta-cpp/compactor.hpp>
#include <treedelta-cpp/differ.hpp>
#include <treedelta-cpp/error.hpp>
#include <treedelta-cpp/inverter.hpp>
#include <treedelta-cpp/merger.hpp>
#include <treedelta-cpp/operation.hpp>
#include <treedelta-cpp/patcher.hpp>
#include <treedelta-cpp/path.hpp>
#include <treedelta-cpp/value.hpp>
