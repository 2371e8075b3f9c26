// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace spindle::db {

//! Failure of the storage backend behind a provider
class ProviderError : public std::runtime_error {
  public:
    explicit ProviderError(const std::string& message) : std::runtime_error{message} {}
};

}  // namespace spindle::db
