/**
 * @file xlsxconv.cpp
 * @brief Implementation of the public Converter API.
 */

#include "../../include/xlsxconv.hpp"

#include "../../include/conversion_pipeline.hpp"
#include "../../include/conversion_worker.hpp"
#include "../../include/text_encoder.hpp"

#include <algorithm>
#include <cctype>

namespace xlsxconv {

struct Converter::Impl {
    ConversionPipeline pipeline;
    ConversionRequest request;

    ConversionReporter* reporter = nullptr;
    LoggerReporter fallbackReporter;

    // created on first async use
    std::unique_ptr<ConversionWorker> worker;

    ConversionReporter& activeReporter() {
        return reporter ? *reporter : fallbackReporter;
    }

    ConversionRequest requestFor(const std::filesystem::path& input) const {
        ConversionRequest r = request;
        r.input_path = input;
        return r;
    }
};

Converter::Converter() : impl_(std::make_unique<Impl>()) {}

Converter::~Converter() = default;

Converter::Converter(Converter&&) noexcept = default;
Converter& Converter::operator=(Converter&&) noexcept = default;

Converter& Converter::sheet(SheetSelector selector) {
    impl_->request.sheet = std::move(selector);
    return *this;
}

Converter& Converter::encoding(const std::string& name) {
    const bool blank = std::ranges::all_of(name, [](const unsigned char c) { return std::isspace(c) != 0; });
    impl_->request.encoding = blank ? std::string(kDefaultEncoding) : name;
    return *this;
}

Converter& Converter::outputDirectory(const std::filesystem::path& dir) {
    impl_->request.output_dir = dir;
    return *this;
}

void Converter::setReporter(ConversionReporter* reporter) {
    impl_->reporter = reporter;
}

ConversionSummary Converter::convert(const std::filesystem::path& input) {
    return impl_->pipeline.run(impl_->requestFor(input), impl_->activeReporter());
}

std::future<ConversionSummary> Converter::convertAsync(const std::filesystem::path& input) {
    if (!impl_->worker) {
        impl_->worker = std::make_unique<ConversionWorker>(impl_->pipeline);
    }
    return impl_->worker->submit(impl_->requestFor(input), impl_->activeReporter());
}

} // namespace xlsxconv
