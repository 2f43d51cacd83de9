// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/error.hpp>
#include <nzbstream/yenc/decoder.hpp>
#include <expected>
#include <memory>
#include <string>

namespace nzbstream::nntp {

using ArticlePtr = std::shared_ptr<const yenc::DecodedArticle>;
using ArticleResult = std::expected<ArticlePtr, std::error_code>;

// Anything that can turn a message-ID into decoded article bytes
class ArticleSource {
public:
    virtual ~ArticleSource() = default;

    // group is a newsgroup hint for providers that need GROUP first; may be empty
    [[nodiscard]] virtual ArticleResult
    fetch_decoded(const std::string& message_id, const std::string& group) noexcept = 0;
};

} // namespace nzbstream::nntp
