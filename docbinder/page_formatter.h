#ifndef DOCBINDER_PAGE_FORMATTER_H
#define DOCBINDER_PAGE_FORMATTER_H

#include <string>
#include <vector>

#include "binder_types.h"
#include "collaborators.h"
#include "pdf_page_writer.h"

namespace DocBinder {

// Cover and contents pages written straight to PDF (US Letter, 1" margins,
// Helvetica). The result needs no further conversion.
class PdfPageFormatter : public Formatter {
public:
    explicit PdfPageFormatter(std::string contentsDate);

    fs::path renderCoverPage(const std::string& index, const std::string& displayName,
                             const fs::path& output) override;
    fs::path renderContentsPage(const std::vector<Item>& items, const BatesMap& bates,
                                const fs::path& output) override;

    // Layout only; return the number of pages produced in writer
    int layoutCover(PdfPageWriter& writer, const std::string& index, const std::string& displayName) const;
    int layoutContents(PdfPageWriter& writer, const std::vector<ContentsEntry>& entries) const;

private:
    std::string contentsDate_;
};

} // namespace DocBinder

#endif // DOCBINDER_PAGE_FORMATTER_H
