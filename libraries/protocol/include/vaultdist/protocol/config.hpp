/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */

#pragma once

/** Smallest units per display unit of the native currency */
#define VAULTDIST_CURRENCY_UNIT_SCALE        1000000
#define VAULTDIST_CURRENCY_PRECISION_DIGITS  6

/** Decimal digits kept by the high precision rounding primitive */
#define VAULTDIST_HIGH_PRECISION_DIGITS      25

/** Largest integer a double represents exactly, 2^53 - 1 */
#define VAULTDIST_MAX_SAFE_INTEGER           int64_t(9007199254740991ll)

#define VAULTDIST_MAX_TOKEN_DECIMALS         8
#define VAULTDIST_MIN_TOKEN_DECIMALS         1
/// Asset quantity assumed when bounding decimals by multiplier size
#define VAULTDIST_ASSUMED_MAX_ASSET_QUANTITY 1000

/** Stored and recomputed amounts may differ by this many smallest units */
#define VAULTDIST_RECONCILIATION_TOLERANCE   1

#define VAULTDIST_DEFAULT_CLAIMS_PAGE_SIZE   10
#define VAULTDIST_MAX_CLAIMS_PAGE_SIZE       100

#define VAULTDIST_DEFAULT_MAX_TRANSACTION_BYTES  15900
#define VAULTDIST_DEFAULT_MAX_CLAIMS_PER_BATCH   12
#define VAULTDIST_DEFAULT_MAX_SETTLE_ATTEMPTS    3
#define VAULTDIST_DEFAULT_BASE_BACKOFF_SECONDS   15
#define VAULTDIST_DEFAULT_MAX_BACKOFF_SECONDS    300
#define VAULTDIST_DEFAULT_BACKOFF_JITTER         0.3
#define VAULTDIST_DEFAULT_LEASE_TTL_SECONDS      600
#define VAULTDIST_DEFAULT_CALL_TIMEOUT_SECONDS   60
#define VAULTDIST_DEFAULT_SWEEP_INTERVAL_SECONDS 300

#define VAULTDIST_MAX_NESTED_OBJECTS (200)
