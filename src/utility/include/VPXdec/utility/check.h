/* Copyright (c) V-Nova International Limited 2025-2026. All rights reserved.
 * This software is licensed under the BSD-3-Clause-Clear License by V-Nova Limited.
 * No patent licenses are granted under this license. For enquiries about patent licenses,
 * please contact legal@v-nova.com.
 * The VPXdec software is a stand-alone project and is NOT A CONTRIBUTION to any other project.
 * If the software is incorporated into another project, THE TERMS OF THE BSD-3-CLAUSE-CLEAR LICENSE
 * AND THE ADDITIONAL LICENSING INFORMATION CONTAINED IN THIS FILE MUST BE MAINTAINED, AND THE
 * SOFTWARE DOES NOT AND MUST NOT ADOPT THE LICENSE OF THE INCORPORATING PROJECT. However, the
 * software may be incorporated into a project under a compatible license provided the requirements
 * of the BSD-3-Clause-Clear license are respected, and V-Nova Limited remains
 * licensor of the software ONLY UNDER the BSD-3-Clause-Clear license (not the compatible license).
 * ANY ONWARD DISTRIBUTION, WHETHER STAND-ALONE OR AS PART OF ANY OTHER PROJECT, REMAINS SUBJECT TO
 * THE EXCLUSION OF PATENT LICENSES PROVISION OF THE BSD-3-CLAUSE-CLEAR LICENSE. */

// Helper macros for checking return codes in samples and tests.
//
#ifndef VD_VPXDEC_UTILITY_CHECK_H
#define VD_VPXDEC_UTILITY_CHECK_H

#include <VPXdec/media/types.h>

/*!
 * \brief Check if an expression returns a ReturnCode error
 *
 * If there is an error prints summary to `stderr` and exits.
 *
 * @param[in]       expr    Some expression that returns vpxdec::ReturnCode
 */
#define VD_VPXDEC_CHECK(expr) vpxdec::utility::checkFn(__FILE__, __LINE__, #expr, expr)

/*!
 * \brief Check if an expression returns a ReturnCode error other than Again
 *
 * If there is an error prints summary to `stderr` and exits.
 *
 * @param[in]       expr    Some expression that returns vpxdec::ReturnCode
 * @return                  true if result was Success
 *                          false if result was Again
 */
#define VD_VPXDEC_AGAIN(expr) vpxdec::utility::againFn(__FILE__, __LINE__, #expr, expr)

/*!
 * \brief Check if an expression returns a ReturnCode error and return it immediately
 *
 * @param[in]       expr    Some expression that returns vpxdec::ReturnCode
 */
#define VD_VPXDEC_CHECK_RET(expr)                     \
    do {                                              \
        const vpxdec::ReturnCode rc = (expr);         \
        if (rc != vpxdec::ReturnCode::Success)        \
            return rc;                                \
    } while (0)

/*!
 * \brief Check if a utility function returns true
 *
 * If it does not, prints summary to `stderr` and exits.
 *
 * @param[in]       expr    Some expression that returns bool
 */
#define VD_UTILITY_CHECK(expr) vpxdec::utility::utilityCheckFn(__FILE__, __LINE__, #expr, expr)
#define VD_UTILITY_CHECK_MSG(expr, msg) \
    vpxdec::utility::utilityCheckFn(__FILE__, __LINE__, #expr, expr, msg)

namespace vpxdec::utility {

// Functions to do the real work of VD_VPXDEC_CHECK(), VD_VPXDEC_AGAIN() and VD_UTILITY_CHECK()
void checkFn(const char* file, int line, const char* expr, ReturnCode r);
bool againFn(const char* file, int line, const char* expr, ReturnCode r);
void utilityCheckFn(const char* file, int line, const char* expr, bool r, const char* msg = "");

} // namespace vpxdec::utility

#endif // VD_VPXDEC_UTILITY_CHECK_H
