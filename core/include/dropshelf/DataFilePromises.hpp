// Promises whose content is already in memory: raw bytes (e.g. an image
// dragged without a file behind it), a text snippet, or a web link.
#pragma once
#include "FilePromise.hpp"
#include <utility>

namespace dropshelf {

class DataFilePromise : public FilePromise {
public:
    DataFilePromise(std::string bytes, std::string suggestedName);

    std::string suggestedName() const override { return name_; }
    std::string describe() const override;
    bool materialize(const std::string &destDir, std::string &outPath,
                     std::string &err, CancelCB shouldCancel = {}) override;

private:
    std::string bytes_;
    std::string name_;
};

// Plain text becomes "snippet.txt".
class TextFilePromise : public FilePromise {
public:
    explicit TextFilePromise(std::string text) : text_(std::move(text)) {}

    std::string suggestedName() const override { return "snippet.txt"; }
    std::string describe() const override { return "text snippet"; }
    bool materialize(const std::string &destDir, std::string &outPath,
                     std::string &err, CancelCB shouldCancel = {}) override;

private:
    std::string text_;
};

// A web URL becomes a freedesktop link file named after the host.
class LinkFilePromise : public FilePromise {
public:
    explicit LinkFilePromise(std::string url) : url_(std::move(url)) {}

    std::string suggestedName() const override;
    std::string describe() const override { return url_; }
    bool materialize(const std::string &destDir, std::string &outPath,
                     std::string &err, CancelCB shouldCancel = {}) override;

    const std::string &url() const { return url_; }
    std::string host() const;

    // Contents written by materialize().
    static std::string desktopEntryFor(const std::string &url,
                                       const std::string &title);

private:
    std::string url_;
};

} // namespace dropshelf
