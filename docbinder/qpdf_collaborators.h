#ifndef DOCBINDER_QPDF_COLLABORATORS_H
#define DOCBINDER_QPDF_COLLABORATORS_H

#include <functional>
#include <string>
#include <vector>

#include "collaborators.h"

class QPDF;

namespace DocBinder {

// ============================================================================
// QPDF backed page services
// ============================================================================

class QpdfPageCounter : public PageCounter {
public:
    int countPages(const fs::path& pdf) override;
};

// Concatenation through QPDFJob (same as: qpdf --empty --pages a.pdf b.pdf -- out.pdf)
class QpdfMerger : public Merger {
public:
    explicit QpdfMerger(PageCounter& counter);

    MergeReport merge(const std::vector<fs::path>& inputs, const fs::path& output) override;

private:
    PageCounter& counter_;
};

// Every edit opens the document, changes it and writes a temp file that then
// replaces the original. /Producer and /Creator are set on each write.
class QpdfPageAnnotator : public PageAnnotator {
public:
    void stampSequential(const fs::path& pdf, int startNumber, int fontSize) override;
    void setOutline(const fs::path& pdf, const std::vector<OutlineEntry>& entries) override;
    std::vector<LinkStatus> insertLinks(const fs::path& pdf, const std::vector<LinkRequest>& requests) override;

private:
    void editInPlace(const fs::path& pdf, const std::string& action, const std::function<void(QPDF&)>& edit);
};

} // namespace DocBinder

#endif // DOCBINDER_QPDF_COLLABORATORS_H
