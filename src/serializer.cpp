#include "plume/serializer.hpp"
#include "format.hpp"
#include <cstdio>
#include <ostream>
#include <utility>

namespace plume {

namespace {

std::string encodeMove(Size2D p) {
    std::string s = "m ";
    detail::appendFixed4(s, p.x.toPt());
    s += ' ';
    detail::appendFixed4(s, p.y.toPt());
    return s;
}

std::string encodeFont(u32 index, Size size) {
    std::string s = "f ";
    s += std::to_string(index);
    s += ' ';
    detail::appendShortest(s, size.toPt());
    return s;
}

std::string encodeText(std::string_view text) {
    std::string s = "w ";
    s.append(text.data(), text.size());
    return s;
}

std::string encodeBox(Size2D p, Size2D size) {
    std::string s = "b ";
    detail::appendFixed4(s, p.x.toPt());
    s += ' ';
    detail::appendFixed4(s, p.y.toPt());
    s += ' ';
    detail::appendFixed4(s, size.x.toPt());
    s += ' ';
    detail::appendFixed4(s, size.y.toPt());
    return s;
}

class CompactEncoder : public ActionVisitor {
public:
    std::string result;

    void visitMoveAbsolute(Size2D p) override { result = encodeMove(p); }
    void visitSetFont(u32 index, Size size) override { result = encodeFont(index, size); }
    void visitWriteText(std::string_view text) override { result = encodeText(text); }
    void visitDebugBox(Size2D p, Size2D size) override { result = encodeBox(p, size); }
};

class DiagnosticFormatter : public ActionVisitor {
public:
    std::string result;

    void visitMoveAbsolute(Size2D p) override {
        result = "move " + p.x.toString() + " " + p.y.toString();
    }
    void visitSetFont(u32 index, Size size) override {
        result = "font " + std::to_string(index) + " " + size.toString();
    }
    void visitWriteText(std::string_view text) override {
        result = "write \"";
        result.append(text.data(), text.size());
        result += '"';
    }
    void visitDebugBox(Size2D p, Size2D size) override {
        result = "box " + p.toString() + " " + size.toString();
    }
};

// One write call per action; a stream that is already bad receives nothing.
// A streambuf that fails partway through keeps whatever it accepted.
bool writeChunk(std::ostream& out, const std::string& chunk) {
    out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    return static_cast<bool>(out);
}

}

std::string encode(const Action& action) {
    CompactEncoder encoder;
    action.accept(encoder);
    return std::move(encoder.result);
}

std::string describe(const Action& action) {
    DiagnosticFormatter formatter;
    action.accept(formatter);
    return std::move(formatter.result);
}

bool serialize(const Action& action, std::ostream& out) {
    if (!writeChunk(out, encode(action))) {
        std::fprintf(stderr, "plume Serializer: sink rejected action: %s\n",
                     describe(action).c_str());
        return false;
    }
    return true;
}

// --- ActionWriter ---

ActionWriter::ActionWriter(std::ostream* out) : out_(out) {}

void ActionWriter::visitMoveAbsolute(Size2D position) {
    writeLine(encodeMove(position));
}

void ActionWriter::visitSetFont(u32 index, Size size) {
    writeLine(encodeFont(index, size));
}

void ActionWriter::visitWriteText(std::string_view text) {
    writeLine(encodeText(text));
}

void ActionWriter::visitDebugBox(Size2D position, Size2D size) {
    writeLine(encodeBox(position, size));
}

void ActionWriter::writeLine(std::string_view line) {
    if (!ok_) return;

    std::string chunk(line);
    chunk += '\n';
    if (!writeChunk(*out_, chunk)) {
        std::fprintf(stderr, "plume ActionWriter: write failed after %u lines\n", lines_);
        ok_ = false;
        return;
    }
    ++lines_;
}

}
