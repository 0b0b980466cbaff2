// SPDX-License-Identifier: MIT

// include/dbxfer/csv_stream.hpp
#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "dbxfer/async_stream.hpp"
#include "dbxfer/context.hpp"
#include "dbxfer/error.hpp"

namespace dbxfer {

/// One named partition of CSV data. The first line of every partition is its header.
struct CsvStream {
    std::string name;       ///< Unique within a transfer
    BoxStream<Bytes> data;  ///< Consumed once, in order
};

/// Name of the partition stored at @p file_path under @p base_path: the
/// relative path with its extension removed. When both are equal (a single
/// file), the file name without extension.
///
/// Works for filesystem paths and object-store URLs alike.
std::expected<std::string, Error> CsvStreamName(std::string_view base_path,
                                                std::string_view file_path);

/// Join every partition of @p streams into a single stream named "combined",
/// keeping only the first header produced. A partition that ends mid-line
/// is terminated with a newline before the next one starts.
CsvStream ConcatenateCsvStreams(Context ctx, BoxStream<CsvStream> streams);

}  // namespace dbxfer
