#include <fragmenter/split/fragment_stream.h>

namespace fragmenter::split {

FragmentStream::FragmentStream(std::unique_ptr<FragmentSource> source)
    : source_(std::move(source)) {}

std::optional<std::string> FragmentStream::next() {
    if (!source_) {
        return std::nullopt;
    }

    auto fragment = source_->next();
    if (!fragment) {
        // Release the scanner and its buffers as soon as the source runs dry
        source_.reset();
        return std::nullopt;
    }

    ++produced_;
    return fragment;
}

std::vector<std::string> FragmentStream::toVector() {
    std::vector<std::string> fragments;
    while (auto fragment = next()) {
        fragments.push_back(std::move(*fragment));
    }
    return fragments;
}

FragmentStream::iterator::iterator(FragmentStream* stream) : stream_(stream) {
    advance();
}

FragmentStream::iterator& FragmentStream::iterator::operator++() {
    advance();
    return *this;
}

void FragmentStream::iterator::advance() {
    if (!stream_) {
        return;
    }
    current_ = stream_->next();
    if (!current_) {
        stream_ = nullptr;
    }
}

} // namespace fragmenter::split
