/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_FILE_HPP
#define DELEGATION_SCOUT_FILE_HPP

#include <string>
#include <ds/common/bytes.hpp>

namespace delegation_scout::file {
    extern void read(const std::string &path, uint8_vector &buf);
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, const buffer &data);
}

#endif // !DELEGATION_SCOUT_FILE_HPP
