/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <string>

namespace zikzi::internal {

// PostScript Document Structuring Convention header values.
struct DscMetadata {
    std::string title;          // %%Title, parentheses stripped
    std::string creator;        // %%Creator
    std::string creation_date;  // %%CreationDate
    std::string for_whom;       // %%For, parentheses stripped
    int         pages = 0;      // %%Pages (0 when absent or "(atend)")
    std::string bounding_box;   // %%BoundingBox
    int         page_markers = 0; // number of %%Page: lines
};

/**
 * Incremental DSC scanner fed with arbitrary chunks of a byte stream.
 * Only lines starting with "%%" or "%!" are inspected; later values win and
 * scanning continues past %%EndComments to the end of the stream.
 */
class DscScanner {
public:
    static constexpr std::size_t kMaxLine = 4096;

    void feed(const char* data, std::size_t n);

    // Flush a trailing line without newline.
    void finish();

    const DscMetadata& metadata() const { return _meta; }

private:
    DscMetadata _meta;
    std::string _line;
    bool        _long = false;   // current line exceeded kMaxLine

    void end_line();
    void inspect(const std::string& line);
};

// Count "%%Page:" lines of a file; -1 when it cannot be read.
int count_dsc_pages(const std::string& path);

} // namespace zikzi::internal
