#ifndef DOCBINDER_SOFFICE_RENDERER_H
#define DOCBINDER_SOFFICE_RENDERER_H

#include <mutex>
#include <string>

#include "collaborators.h"

namespace DocBinder {

// Renderer backed by LibreOffice running headless as an external process.
// PDF sources pass through unchanged. Each conversion gets its own scratch
// directory and user profile so several can run at once.
class SofficeRenderer : public Renderer {
public:
    // converter: executable to use; empty = discover on first conversion
    explicit SofficeRenderer(std::string converter = "");

    fs::path render(const fs::path& source, const fs::path& outputPdf) override;

    // Configured path, then soffice/libreoffice on PATH and the usual install
    // locations. Empty if none answers --version.
    static std::string findConverter(const std::string& preferred);

private:
    std::string configured_;
    std::string converter_;
    std::once_flag discovered_;

    const std::string& resolveConverter();
};

} // namespace DocBinder

#endif // DOCBINDER_SOFFICE_RENDERER_H
