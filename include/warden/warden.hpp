// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <warden/version.h>

#include <warden/errors.hpp>
#include <warden/events.hpp>
#include <warden/session_key_validator.hpp>
#include <warden/wallet.hpp>
