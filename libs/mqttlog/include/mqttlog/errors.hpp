// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file errors.hpp
/// @brief Exception types raised by the mqttlog library
///
/// Only programmer errors and unrepresentable records are exceptions.
/// Broker and queue failures are reported through counters instead
/// (see PipelineStats::connect_failures, ::overflow and ::dropped).

#include <stdexcept>
#include <string>

namespace mqttlog {

/// Base class for all mqttlog exceptions
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// A record cannot be represented in the payload encoding
class EncodingError : public Error {
public:
    explicit EncodingError(const std::string& what) : Error(what) {}
};

/// publish() was attempted while the connection is not established
class NotConnectedError : public Error {
public:
    explicit NotConnectedError(const std::string& what) : Error(what) {}
};

/// Invalid or unreadable pipeline configuration
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

}  // namespace mqttlog
