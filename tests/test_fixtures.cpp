#include "test_fixtures.hpp"
#include "upload_guard/common/config.hpp"
#include <fstream>
#include <stdexcept>
#include <vector>
#include <cstdlib>
#include <unistd.h>
#include <sys/stat.h>

namespace upload_guard {
namespace test_support {

namespace {

uint32_t crc32(const std::string& data) {
    uint32_t crc = 0xffffffffu;
    for (unsigned char c : data) {
        crc ^= c;
        for (int k = 0; k < 8; ++k) {
            crc = (crc >> 1) ^ (0xedb88320u & (0u - (crc & 1u)));
        }
    }
    return crc ^ 0xffffffffu;
}

std::string be32(uint32_t value) {
    std::string out(4, '\0');
    out[0] = static_cast<char>((value >> 24) & 0xff);
    out[1] = static_cast<char>((value >> 16) & 0xff);
    out[2] = static_cast<char>((value >> 8) & 0xff);
    out[3] = static_cast<char>(value & 0xff);
    return out;
}

std::string le16(uint16_t value) {
    std::string out;
    out.push_back(static_cast<char>(value & 0xff));
    out.push_back(static_cast<char>((value >> 8) & 0xff));
    return out;
}

std::string le32(uint32_t value) {
    return le16(static_cast<uint16_t>(value & 0xffff)) + le16(static_cast<uint16_t>(value >> 16));
}

std::string pngChunk(const std::string& type, const std::string& data) {
    return be32(static_cast<uint32_t>(data.size())) + type + data + be32(crc32(type + data));
}

std::string htmlBlock() {
    const std::string head =
        "<!DOCTYPE html>\n<html><head><title>x</title></head>"
        "<body><script>alert(document.cookie)</script>";
    const std::string pad = "<p>payload</p>\n";
    const std::string tail = "</body></html>\n";

    std::string block = head;
    while (block.size() + pad.size() <= 2048 - tail.size()) {
        block += pad;
    }
    block += tail;
    block.resize(2048, ' ');
    return block;
}

}

std::string lcgBytes(size_t count, uint32_t seed) {
    std::string out;
    out.reserve(count);
    uint32_t state = seed;
    for (size_t i = 0; i < count; ++i) {
        state = (state * 1103515245u + 12345u) & 0x7fffffffu;
        out.push_back(static_cast<char>((state >> 16) & 0xff));
    }
    return out;
}

std::string makePng() {
    std::string ihdr = be32(64) + be32(64);
    ihdr += std::string("\x08\x06\x00\x00\x00", 5);

    std::string png("\x89PNG\r\n\x1a\n", 8);
    png += pngChunk("IHDR", ihdr);
    png += pngChunk("IDAT", lcgBytes(16384, 12345));
    png += pngChunk("IEND", "");
    return png;
}

std::string makeJpeg() {
    const unsigned char header[] = {
        0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F', 0x00,
        0x01, 0x01, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00
    };
    std::string jpeg(reinterpret_cast<const char*>(header), sizeof(header));
    jpeg += lcgBytes(16384, 777);
    jpeg += std::string("\xFF\xD9", 2);
    return jpeg;
}

std::string makePdf() {
    std::string pdf = "%PDF-1.4\n1 0 obj\n<< /Length 16384 >>\nstream\n";
    pdf += lcgBytes(16384, 99);
    pdf += "\nendstream\nendobj\ntrailer\n<< /Root 1 0 R >>\n%%EOF\n";
    return pdf;
}

std::string makeText() {
    std::string text;
    for (int i = 0; i < 200; ++i) {
        text += "line " + std::to_string(i) + " of plain text notes\n";
    }
    return text;
}

std::string makeHtml() {
    return "<!DOCTYPE html>\n<html><head><title>x</title></head>"
           "<body><script>alert(document.cookie)</script></body></html>\n";
}

size_t polyglotHtmlOffset() {
    return (makePng().size() + 2048) / 2;
}

std::string makePolyglotPng() {
    return insertAt(makePng(), polyglotHtmlOffset(), htmlBlock());
}

std::string makePolyglotPngAt(size_t offset) {
    return insertAt(makePng(), offset, htmlBlock());
}

std::string makeElf() {
    std::string elf("\x7f" "ELF\x02\x01\x01\x00", 8);
    elf += std::string(8, '\0');
    elf += le16(2) + le16(62) + le32(1);
    elf += lcgBytes(4000, 5);
    return elf;
}

std::string makeWav() {
    std::string samples = lcgBytes(8000, 42);

    std::string fmt = le16(1) + le16(1) + le32(8000) + le32(16000) + le16(2) + le16(16);
    std::string wav = "RIFF" + le32(static_cast<uint32_t>(36 + samples.size())) + "WAVE";
    wav += "fmt " + le32(static_cast<uint32_t>(fmt.size())) + fmt;
    wav += "data" + le32(static_cast<uint32_t>(samples.size())) + samples;
    return wav;
}

std::string insertAt(const std::string& base, size_t offset, const std::string& payload) {
    return base.substr(0, offset) + payload + base.substr(offset);
}

const uint8_t* bytes(const std::string& data) {
    return reinterpret_cast<const uint8_t*>(data.data());
}

common::ValidatorConfig defaultValidatorConfig() {
    return common::Config::createDefaultConfig().validator;
}

TempDir::TempDir() {
    std::string tmpl = (std::filesystem::temp_directory_path() / "upload-guard-test-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        throw std::runtime_error("mkdtemp failed");
    }
    path_ = buf.data();
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempDir::writeFile(const std::string& name, const std::string& content) const {
    auto file_path = path_ / name;
    std::filesystem::create_directories(file_path.parent_path());
    std::ofstream out(file_path, std::ios::binary);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return file_path;
}

std::filesystem::path TempDir::writeScript(const std::string& name, const std::string& body) const {
    auto script = writeFile(name, "#!/bin/sh\n" + body);
    ::chmod(script.c_str(), 0755);
    return script;
}

}}
