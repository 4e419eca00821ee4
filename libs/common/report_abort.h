/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_REPORT_ABORT_H
#define KATJING_REPORT_ABORT_H

#include <stdio.h>
#include <stdlib.h>

/*
 * Fatal tier of error handling. Used where a preceding check guarantees the
 * operation cannot fail, so a failure means a broken contract rather than a
 * condition the caller could recover from.
 */

#define assert_in_release(e) \
  ((void)((e) ? ((void)0) : __print_failed_assertion(#e, __FILE__, __LINE__)))
#define __print_failed_assertion(e, file, line)                          \
  ((void)fprintf(stderr, "%s:%d: failed assertion `%s'\n", file, line, e), \
   abort())

#define report_abort(msg) \
  ((void)fprintf(stderr, "%s:%d: `%s'\n", __FILE__, __LINE__, msg), abort())

#endif  // KATJING_REPORT_ABORT_H
