#ifndef DOCBINDER_COLLABORATORS_H
#define DOCBINDER_COLLABORATORS_H

#include <filesystem>
#include <string>
#include <vector>

#include "binder_types.h"

namespace DocBinder {

namespace fs = std::filesystem;

// Converts a source document into a PDF.
// Throws RenderFailure if the source is missing, the backend fails or the
// output does not exist afterwards. PDFs may be returned unchanged.
class Renderer {
public:
    virtual ~Renderer() = default;
    virtual fs::path render(const fs::path& source, const fs::path& outputPdf) = 0;
};

// Page count of a PDF; 0 when it cannot be read
class PageCounter {
public:
    virtual ~PageCounter() = default;
    virtual int countPages(const fs::path& pdf) = 0;
};

struct MergeReport {
    int pagesWritten = 0;
    std::vector<fs::path> merged;
    std::vector<fs::path> skipped;   // missing or empty inputs
};

// Concatenates PDFs in the given order. Missing and 0-page inputs are skipped
// with a warning; OutputWriteFailure if nothing can be written.
class Merger {
public:
    virtual ~Merger() = default;
    virtual MergeReport merge(const std::vector<fs::path>& inputs, const fs::path& output) = 0;
};

struct OutlineEntry {
    int level = 1;          // 1 = top level
    std::string title;      // UTF-8
    int pageIndex = 0;      // 0-based target page
};

struct LinkRequest {
    std::vector<int> searchPages;   // 0-based pages to search
    std::string text;               // UTF-8, matched literally
    int targetPage = 0;             // 0-based
};

enum class LinkStatus {
    Linked,
    NotFound
};

// Edits a finished PDF in place (temp file + atomic replace).
// Throws OutputWriteFailure if the document cannot be opened or written.
class PageAnnotator {
public:
    virtual ~PageAnnotator() = default;

    // Numbered label on every page: start, start+1, ...
    virtual void stampSequential(const fs::path& pdf, int startNumber, int fontSize) = 0;

    // Replaces the document outline
    virtual void setOutline(const fs::path& pdf, const std::vector<OutlineEntry>& entries) = 0;

    // One status per request, same order
    virtual std::vector<LinkStatus> insertLinks(const fs::path& pdf, const std::vector<LinkRequest>& requests) = 0;

    LinkStatus insertLink(const fs::path& pdf, int pageIndex, const std::string& textToFind, int targetPageIndex) {
        LinkRequest request;
        request.searchPages.push_back(pageIndex);
        request.text = textToFind;
        request.targetPage = targetPageIndex;
        return insertLinks(pdf, {request}).front();
    }
};

// Lays out generated pages. Outputs are handed to the Renderer afterwards.
class Formatter {
public:
    virtual ~Formatter() = default;
    virtual fs::path renderCoverPage(const std::string& index, const std::string& displayName,
                                     const fs::path& output) = 0;
    // Empty map = placeholder pass
    virtual fs::path renderContentsPage(const std::vector<Item>& items, const BatesMap& bates,
                                        const fs::path& output) = 0;
};

} // namespace DocBinder

#endif // DOCBINDER_COLLABORATORS_H
