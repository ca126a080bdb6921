#include "dropshelf/DataFilePromises.hpp"

#include <utility>

namespace dropshelf {

DataFilePromise::DataFilePromise(std::string bytes, std::string suggestedName)
    : bytes_(std::move(bytes)), name_(std::move(suggestedName)) {
    if (name_.empty())
        name_ = "file.dat";
}

std::string DataFilePromise::describe() const {
    return name_ + " (" + std::to_string(bytes_.size()) + " bytes)";
}

bool DataFilePromise::materialize(const std::string &destDir,
                                  std::string &outPath, std::string &err,
                                  CancelCB shouldCancel) {
    if (shouldCancel && shouldCancel()) {
        err = "Canceled";
        return false;
    }
    return writeStagedFile(destDir, name_, bytes_, outPath, err);
}

bool TextFilePromise::materialize(const std::string &destDir,
                                  std::string &outPath, std::string &err,
                                  CancelCB shouldCancel) {
    if (shouldCancel && shouldCancel()) {
        err = "Canceled";
        return false;
    }
    if (text_.empty()) {
        err = "Empty text snippet";
        return false;
    }
    return writeStagedFile(destDir, suggestedName(), text_, outPath, err);
}

std::string LinkFilePromise::host() const {
    std::string rest = url_;
    const auto scheme = rest.find("://");
    if (scheme != std::string::npos)
        rest = rest.substr(scheme + 3);
    const auto end = rest.find_first_of("/?#");
    if (end != std::string::npos)
        rest = rest.substr(0, end);
    const auto at = rest.rfind('@');
    if (at != std::string::npos)
        rest = rest.substr(at + 1);
    // Keep IPv6 literals intact, strip ":port" otherwise.
    if (!rest.empty() && rest.front() != '[') {
        const auto colon = rest.find(':');
        if (colon != std::string::npos)
            rest = rest.substr(0, colon);
    }
    return rest;
}

std::string LinkFilePromise::suggestedName() const {
    const std::string h = host();
    return (h.empty() ? std::string("link") : h) + ".desktop";
}

std::string LinkFilePromise::desktopEntryFor(const std::string &url,
                                             const std::string &title) {
    std::string out;
    out += "[Desktop Entry]\n";
    out += "Version=1.0\n";
    out += "Type=Link\n";
    out += "Name=" + title + "\n";
    out += "URL=" + url + "\n";
    out += "Icon=text-html\n";
    return out;
}

bool LinkFilePromise::materialize(const std::string &destDir,
                                  std::string &outPath, std::string &err,
                                  CancelCB shouldCancel) {
    if (shouldCancel && shouldCancel()) {
        err = "Canceled";
        return false;
    }
    if (url_.empty()) {
        err = "Empty URL";
        return false;
    }
    const std::string h = host();
    return writeStagedFile(destDir, suggestedName(),
                           desktopEntryFor(url_, h.empty() ? url_ : h),
                           outPath, err);
}

} // namespace dropshelf
