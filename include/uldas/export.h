#pragma once

/**
 * @file export.h
 * @brief DLL export/import macros for the ULDAS libraries
 *
 * NOTE: With WINDOWS_EXPORT_ALL_SYMBOLS, CMake auto-generates exports.
 *       ULDAS_API is kept as an empty macro and has no effect.
 */

#define ULDAS_API

// For classes that should not be exported (internal use only)
#define ULDAS_INTERNAL
