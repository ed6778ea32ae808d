// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <pdfwriter.hpp>
#include <utils.hpp>

#include <memory>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace hiccpdf::internal {

rvoe<NoReturnValue> PdfWriter::write_to_file(const std::filesystem::path &ofilename) {
    std::filesystem::path tempfname(ofilename);
    tempfname.replace_extension(".pdf~");
    FILE *out_file = fopen(tempfname.string().c_str(), "wb");
    if(!out_file) {
        perror(nullptr);
        RETERR_ATTR(CouldNotOpenFile, "", "", "writable path", tempfname.string());
    }
    std::unique_ptr<FILE, FileCloser> fcloser(out_file);

    ERCV(write_bytes(out_file, pdf_text.data(), pdf_text.size()));
    if(fflush(out_file) != 0) {
        perror(nullptr);
        RETERR(FileWriteError);
    }
    if(
#ifdef _WIN32
        _commit(fileno(out_file))
#else
        fsync(fileno(out_file))
#endif
        != 0) {

        perror(nullptr);
        RETERR(FileWriteError);
    }
    // Close the file manually to verify it worked.
    fcloser.release();
    if(fclose(out_file) != 0) {
        perror(nullptr);
        RETERR(FileWriteError);
    }

    // If we made it here, the file has been fully written and fsync'd to disk. Now replace.
    std::error_code ec;
    std::filesystem::rename(tempfname, ofilename, ec);
    if(ec) {
        fprintf(stderr, "%s\n", ec.message().c_str());
        RETERR_ATTR(FileWriteError, "", "", "rename to target", ofilename.string());
    }
    RETOK;
}

rvoe<NoReturnValue> PdfWriter::write_bytes(FILE *ofile, const char *buf, size_t buf_size) {
    if(fwrite(buf, 1, buf_size, ofile) != buf_size) {
        perror(nullptr);
        RETERR(FileWriteError);
    }
    RETOK;
}

} // namespace hiccpdf::internal
