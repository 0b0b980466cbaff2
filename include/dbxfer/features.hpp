// SPDX-License-Identifier: MIT

// include/dbxfer/features.hpp
#pragma once

#include <cstdint>
#include <string>
#include <type_traits>

#include "dbxfer/if_exists.hpp"

namespace dbxfer {

/// Enable bitwise operators on a flag enum.
template <typename E>
struct EnableBitmask : std::false_type {};

template <typename E>
concept Bitmask = EnableBitmask<E>::value;

template <Bitmask E>
constexpr E operator|(E a, E b) {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(a) | static_cast<U>(b));
}

template <Bitmask E>
constexpr E operator&(E a, E b) {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(a) & static_cast<U>(b));
}

/// True if every flag in @p required is set in @p flags.
template <Bitmask E>
constexpr bool HasAll(E flags, E required) {
    return (flags & required) == required;
}

/// Operations a locator implements.
enum class LocatorFeatures : uint8_t {
    None = 0,
    Schema = 1 << 0,          ///< Schema() returns the current table schema
    WriteSchema = 1 << 1,     ///< WriteSchema() persists a table schema
    LocalData = 1 << 2,       ///< LocalData() yields CSV partitions
    WriteLocalData = 1 << 3,  ///< WriteLocalData() consumes CSV partitions
};

/// IfExists policies a locator honors.
enum class IfExistsFeatures : uint8_t {
    None = 0,
    Error = 1 << 0,
    Overwrite = 1 << 1,
    Append = 1 << 2,
    Upsert = 1 << 3,

    NoAppend = (1 << 0) | (1 << 1),  ///< Error | Overwrite
};

/// Extra arguments a locator accepts when used as a source.
enum class SourceArgumentsFeatures : uint8_t {
    None = 0,
    DriverArgs = 1 << 0,
    WhereClause = 1 << 1,
};

/// Extra arguments a locator accepts when used as a destination.
enum class DestinationArgumentsFeatures : uint8_t {
    None = 0,
    DriverArgs = 1 << 0,
};

template <> struct EnableBitmask<LocatorFeatures> : std::true_type {};
template <> struct EnableBitmask<IfExistsFeatures> : std::true_type {};
template <> struct EnableBitmask<SourceArgumentsFeatures> : std::true_type {};
template <> struct EnableBitmask<DestinationArgumentsFeatures> : std::true_type {};

/// Bit corresponding to a parsed IfExists value.
constexpr IfExistsFeatures ToFeature(IfExists::Policy policy) {
    switch (policy) {
        case IfExists::Policy::Error:
            return IfExistsFeatures::Error;
        case IfExists::Policy::Overwrite:
            return IfExistsFeatures::Overwrite;
        case IfExists::Policy::Append:
            return IfExistsFeatures::Append;
        case IfExists::Policy::Upsert:
            return IfExistsFeatures::Upsert;
    }
    return IfExistsFeatures::None;
}

/// Static capability descriptor of a locator type.
///
/// Advertised features must exactly match what the type implements: the copy
/// engine refuses any request outside this set before it touches any data.
struct Features {
    LocatorFeatures locator = LocatorFeatures::None;
    IfExistsFeatures write_schema_if_exists = IfExistsFeatures::None;
    IfExistsFeatures dest_if_exists = IfExistsFeatures::None;
    SourceArgumentsFeatures source_args = SourceArgumentsFeatures::None;
    DestinationArgumentsFeatures dest_args = DestinationArgumentsFeatures::None;

    bool Supports(LocatorFeatures f) const { return HasAll(locator, f); }

    bool SupportsDestIfExists(const IfExists& if_exists) const {
        return HasAll(dest_if_exists, ToFeature(if_exists.policy()));
    }

    bool SupportsWriteSchemaIfExists(const IfExists& if_exists) const {
        return HasAll(write_schema_if_exists, ToFeature(if_exists.policy()));
    }

    /// Multi-line human-readable description (used by `dbxfer features`).
    std::string Describe() const;
};

}  // namespace dbxfer
