/**
 * @file errors.hpp
 * @brief Exception types thrown inside libxlsxconv.
 *
 * None of these reach a host through ConversionPipeline::run; the pipeline
 * turns them into per-file results.
 */

#ifndef XLSXCONV_ERRORS_HPP
#define XLSXCONV_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace xlsxconv {

/// The workbook could not be opened or parsed.
class WorkbookError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The selector names no sheet of the workbook.
class SheetNotFoundError : public WorkbookError {
public:
    using WorkbookError::WorkbookError;
};

/// Unknown encoding, or text that the encoding cannot represent.
class EncodingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace xlsxconv

#endif // XLSXCONV_ERRORS_HPP
