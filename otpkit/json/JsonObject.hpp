/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_JSON_JSON_OBJECT_HPP
#define OTPKIT_JSON_JSON_OBJECT_HPP

#include "JsonPtr.hpp"

namespace otpkit {

/**
 * A JsonPtr with an object (key-value pair) as it's root element.
 * This allows all sorts of member lookups.
 */
class JsonObject:
    public JsonPtr
{
public:
    /**
     * Fails unless the root exists and is an object.
     */
    Status
    ok() const;

protected:
    /**
     * Writes a key-value pair to the root object,
     * creating the root if necessary.
     * Takes ownership of the passed-in value.
     */
    Status
    setValue(const char *key, json_t *value);

    // Type helpers. A missing key counts as valid, since it takes the fallback:
    Status hasString (const char *key) const;
    Status hasInteger(const char *key) const;

    // Read helpers:
    const char *getString (const char *key, const char *fallback) const;
    json_int_t  getInteger(const char *key, json_int_t fallback) const;
};

// Helper macros for implementing JsonObject child classes:

#define OTP_JSON_STRING(name, key, fallback) \
    const char *name() const                    { return getString(key, fallback); } \
    otpkit::Status name##Ok() const             { return hasString(key); } \
    otpkit::Status name##Set(const char *value) { return setValue(key, json_string(value)); }

#define OTP_JSON_INTEGER(name, key, fallback) \
    json_int_t name() const                     { return getInteger(key, fallback); } \
    otpkit::Status name##Ok() const             { return hasInteger(key); } \
    otpkit::Status name##Set(json_int_t value)  { return setValue(key, json_integer(value)); }

} // namespace otpkit

#endif
