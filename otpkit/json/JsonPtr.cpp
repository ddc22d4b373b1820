/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonPtr.hpp"
#include "../util/Debug.hpp"
#include <stdlib.h>
#include <new>

namespace otpkit {

constexpr size_t loadFlags = 0;
constexpr size_t saveFlags = JSON_INDENT(4) | JSON_SORT_KEYS;

JsonPtr::~JsonPtr()
{
    reset();
}

JsonPtr::JsonPtr():
    root_(nullptr)
{}

void
JsonPtr::reset(json_t *root)
{
    if (root_)
        json_decref(root_);
    root_ = root;
}

Status
JsonPtr::load(const std::string &filename)
{
    json_error_t error;
    json_t *root = json_load_file(filename.c_str(), loadFlags, &error);
    if (!root)
        return OTP_ERROR(OTP_CC_JSONError, error.text);
    reset(root);
    return Status();
}

Status
JsonPtr::decode(const std::string &data)
{
    json_error_t error;
    json_t *root = json_loadb(data.data(), data.size(), loadFlags, &error);
    if (!root)
        return OTP_ERROR(OTP_CC_JSONError, error.text);
    reset(root);
    return Status();
}

Status
JsonPtr::save(const std::string &filename) const
{
    OTP_DebugLog("Writing JSON file %s", filename.c_str());
    if (json_dump_file(root_, filename.c_str(), saveFlags))
        return OTP_ERROR(OTP_CC_FileOpenError,
                         "Cannot write JSON file " + filename);
    return Status();
}

std::string
JsonPtr::encode() const
{
    auto raw = json_dumps(root_, saveFlags);
    if (!raw)
        throw std::bad_alloc();
    std::string out(raw);
    free(raw);
    return out;
}

} // namespace otpkit
