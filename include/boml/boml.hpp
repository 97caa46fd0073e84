/**
 * @file boml.hpp
 * @brief Convenience header for the core library
 *
 * Pulls in parsing, accessors, diagnostics, conversion and dot paths.
 * The interop headers (Json.hpp, DateTime.hpp) need nlohmann_json and
 * toml++ and are included separately.
 */

#ifndef BOML_BOML_HPP
#define BOML_BOML_HPP

#include "boml/Convert.hpp"
#include "boml/Diagnostics.hpp"
#include "boml/DotPath.hpp"
#include "boml/Errors.hpp"
#include "boml/Parser.hpp"
#include "boml/Span.hpp"
#include "boml/Table.hpp"
#include "boml/TomlString.hpp"
#include "boml/Value.hpp"
#include "boml/ValueKind.hpp"

#endif // BOML_BOML_HPP
