/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <string>

namespace zikzi::internal {

// Verify `password` against a crypt(3) hash ("$2b$12$...", "$6$...").
// Empty or unsupported hashes never verify.
bool verify_password(const std::string& hash, const std::string& password);

} // namespace zikzi::internal
