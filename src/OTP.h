/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Public condition codes for the one-time password library.
 */

#ifndef OTP_h
#define OTP_h

#include <stdint.h>

/** The maximum number of decimal digits in a generated code */
#define OTP_MAX_CODE_DIGITS 8

#define OTP_VERSION "1.0.0"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * OTP Condition Codes
 *
 * All fallible library functions report one of these codes.
 * OTP_CC_Ok indicates that there was no issue.
 * All other values indicate some issue.
 */
typedef enum eOTP_CC
{
    /** The function completed without an error */
    OTP_CC_Ok = 0,
    /** An error occured */
    OTP_CC_Error = 1,
    /** The hash algorithm selector is not SHA1, SHA256 or SHA512 */
    OTP_CC_UnknownAlgorithm = 2,
    /** The system random source failed */
    OTP_CC_RandomSourceError = 3,
    /** The code length is outside of 1..OTP_MAX_CODE_DIGITS */
    OTP_CC_InvalidDigitCount = 4,
    /** The TOTP time step is not positive */
    OTP_CC_InvalidTimeStep = 5,
    /** The TOTP look-backward window is negative */
    OTP_CC_InvalidLookBackward = 6,
    /** The TOTP look-forward window is negative */
    OTP_CC_InvalidLookForward = 7,
    /** Malformed encoded input */
    OTP_CC_ParseError = 8,
    /** Malformed or unusable JSON */
    OTP_CC_JSONError = 9,
    /** Could not open file */
    OTP_CC_FileOpenError = 10
} tOTP_CC;

#ifdef __cplusplus
}
#endif

#endif
