/// @file jd.hpp
/// @brief Umbrella header for the jd-cpp library.
///
/// Include this single header for access to all public types and
/// operations: Node, Path, Diff, diff(), apply_patch(), reverse(), the
/// renderers and their readers, and Error.

#pragma once

#include <jd-cpp/diff.hpp>
#include <jd-cpp/error.hpp>
#include <jd-cpp/json.hpp>
#include <jd-cpp/node.hpp>
#include <jd-cpp/options.hpp>
#include <jd-cpp/parse.hpp>
#include <jd-cpp/patch.hpp>
#include <jd-cpp/path.hpp>
#include <jd-cpp/render.hpp>
