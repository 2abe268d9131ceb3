#include "test_common.h"
#include "restgate/http/errors.hpp"
#include "restgate/http/file_validator.hpp"
#include "restgate/http/form_file.hpp"
#include "restgate/http/multipart_parser.hpp"

using namespace restgate;
using namespace restgate::http;

namespace {

std::string part(const std::string &boundary, const std::string &disposition, const std::string &contentType,
                 const std::string &payload) {
    std::string out = "--" + boundary + "\r\nContent-Disposition: form-data; " + disposition + "\r\n";
    if (!contentType.empty()) out += "Content-Type: " + contentType + "\r\n";
    return out + "\r\n" + payload + "\r\n";
}

} // namespace

int main() {
    quiet_logs();

    const std::string boundary = "----restgateBoundary7MA4YWxk";
    // Binary payload with CR/LF, NUL and a fake delimiter prefix inside
    std::string binary("\x89PNG\r\n\x1a\n\0\0\0\rIHDR--not-a-boundary\r\n", 33);
    binary.push_back('\xff');

    std::string body = part(boundary, "name=\"description\"", "", "Quarterly report\r\nsecond line")
                     + part(boundary, "name=\"categoryId\"", "", "7")
                     + part(boundary, "name=\"file\"; filename=\"chart.png\"", "image/png", binary)
                     + part(boundary, "name=\"empty\"; filename=\"\"", "", "")
                     + "--" + boundary + "--\r\n";

    FormFieldMap fields = MultipartParser::parse(body, "multipart/form-data; boundary=" + boundary);
    if (fields.size() != 4) { std::cerr << "[TEST] expected 4 parts, got " << fields.size() << "\n"; return 65; }

    const FormField &description = fields.at("Description");
    if (description.isFile() || description.value != "Quarterly report\r\nsecond line") { std::cerr << "[TEST] text part altered\n"; return 66; }
    if (fields.at("categoryId").value != "7") { std::cerr << "[TEST] numeric part altered\n"; return 67; }

    const FormField &file = fields.at("file");
    if (!file.isFile() || *file.fileName != "chart.png" || file.contentType.value_or("") != "image/png") { std::cerr << "[TEST] file part metadata\n"; return 68; }
    if (file.data != binary) { std::cerr << "[TEST] file bytes not byte-identical\n"; return 69; }

    // An empty filename is not a file
    if (fields.at("empty").isFile()) { std::cerr << "[TEST] empty filename treated as file\n"; return 70; }

    // Quoted boundary
    FormFieldMap quoted = MultipartParser::parse(body, "multipart/form-data; boundary=\"" + boundary + "\"");
    if (quoted.size() != 4) { std::cerr << "[TEST] quoted boundary not honored\n"; return 71; }

    // No boundary is a client error
    bool threw = false;
    try { MultipartParser::parse(body, "multipart/form-data"); }
    catch (const ClientInputError &ex) { threw = ex.statusCode() == 400; }
    if (!threw) { std::cerr << "[TEST] missing boundary accepted\n"; return 72; }

    // FormFile wraps a decoded part
    auto formFile = FormFile::fromField(file);
    if (formFile->length() != static_cast<int64_t>(binary.size()) || formFile->fileName() != "chart.png") { std::cerr << "[TEST] form file view\n"; return 73; }

    // Content validation: declared PNG with a PNG signature passes, an executable does not
    FileValidator validator(FileValidationOptions::fromLists(1024, ".png, .jpg", "image/png,image/jpeg"));
    if (!validator.validate(*formFile).isValid()) { std::cerr << "[TEST] valid png rejected\n"; return 74; }
    FormFile exe("file", "tool.exe", "application/octet-stream", std::string("MZ\x90\0", 4));
    if (validator.validate(exe).isValid()) { std::cerr << "[TEST] executable accepted\n"; return 75; }

    // URL-encoded forms; malformed pairs are skipped
    CaseInsensitiveMap form = parse_urlencoded("name=John+Doe&city=S%C3%A3o%20Paulo&broken&a=b=c");
    if (form.at("NAME") != "John Doe" || form.at("city") != "S\xc3\xa3o Paulo") { std::cerr << "[TEST] urlencoded decoding\n"; return 76; }
    if (form.count("broken") || form.count("a")) { std::cerr << "[TEST] malformed pair kept\n"; return 77; }

    std::cout << "[TEST] OK multipart parser\n";
    return 0;
}
