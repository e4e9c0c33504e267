#include <gtest/gtest.h>
#include <plume/serializer.hpp>
#include <plume/action_buffer.hpp>

#include <sstream>
#include <streambuf>
#include <string>

using namespace plume;

static Size2D at(f32 x, f32 y) {
    return {Size::pt(x), Size::pt(y)};
}

// A sink that accepts a fixed number of bytes and rejects everything after.
class LimitedBuf : public std::streambuf {
public:
    explicit LimitedBuf(size_t capacity) : capacity_(capacity) {}

    const std::string& data() const { return data_; }

protected:
    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) return traits_type::not_eof(ch);
        if (data_.size() >= capacity_) return traits_type::eof();
        data_.push_back(traits_type::to_char_type(ch));
        return ch;
    }

    std::streamsize xsputn(const char* s, std::streamsize n) override {
        if (data_.size() + static_cast<size_t>(n) > capacity_) return 0;
        data_.append(s, static_cast<size_t>(n));
        return n;
    }

private:
    size_t capacity_;
    std::string data_;
};

// A sink with no bulk write: bytes go through overflow() one at a time, so a
// write that runs out of room leaves the bytes that fit.
class CharLimitedBuf : public std::streambuf {
public:
    explicit CharLimitedBuf(size_t capacity) : capacity_(capacity) {}

    const std::string& data() const { return data_; }

protected:
    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) return traits_type::not_eof(ch);
        if (data_.size() >= capacity_) return traits_type::eof();
        data_.push_back(traits_type::to_char_type(ch));
        return ch;
    }

private:
    size_t capacity_;
    std::string data_;
};

// --- Compact form ---

TEST(Encode, MoveUsesFourDecimals) {
    EXPECT_EQ(encode(Action::MoveAbsolute(at(3.5f, 4.0f))), "m 3.5000 4.0000");
    EXPECT_EQ(encode(Action::MoveAbsolute(at(0, -12.25f))), "m 0.0000 -12.2500");
}

TEST(Encode, MoveRoundsToFourDecimals) {
    EXPECT_EQ(encode(Action::MoveAbsolute(at(1.00004f, 2.99996f))), "m 1.0000 3.0000");
}

TEST(Encode, MoveIsInPoints) {
    Action a = Action::MoveAbsolute({Size::inches(1), Size::inches(0.5f)});
    EXPECT_EQ(encode(a), "m 72.0000 36.0000");
}

TEST(Encode, FontSizeIsUnrounded) {
    EXPECT_EQ(encode(Action::SetFont(0, Size::pt(12))), "f 0 12");
    EXPECT_EQ(encode(Action::SetFont(7, Size::pt(10.5f))), "f 7 10.5");
    EXPECT_EQ(encode(Action::SetFont(3, Size::pt(0.1f))), "f 3 0.1");
}

TEST(Encode, TextIsRaw) {
    EXPECT_EQ(encode(Action::WriteText("Hello, World!")), "w Hello, World!");
    EXPECT_EQ(encode(Action::WriteText("a \"quoted\" word")), "w a \"quoted\" word");
    EXPECT_EQ(encode(Action::WriteText("")), "w ");
}

TEST(Encode, DebugBoxUsesFourDecimals) {
    EXPECT_EQ(encode(Action::DebugBox(at(1, 2.5f), at(100, 50.125f))),
              "b 1.0000 2.5000 100.0000 50.1250");
}

// --- Diagnostic form ---

TEST(Describe, AllVariants) {
    EXPECT_EQ(describe(Action::MoveAbsolute(at(10, 20.5f))), "move 10pt 20.5pt");
    EXPECT_EQ(describe(Action::SetFont(1, Size::pt(12))), "font 1 12pt");
    EXPECT_EQ(describe(Action::WriteText("hi")), "write \"hi\"");
    EXPECT_EQ(describe(Action::DebugBox(at(1, 2), at(3, 4))), "box [1pt, 2pt] [3pt, 4pt]");
}

// --- serialize() to a sink ---

TEST(Serialize, WritesCompactFormWithoutTerminator) {
    std::ostringstream out;
    EXPECT_TRUE(serialize(Action::MoveAbsolute(at(3.5f, 4.0f)), out));
    EXPECT_EQ(out.str(), "m 3.5000 4.0000");
}

TEST(Serialize, FailedSinkReportsFalseAndWritesNothing) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    EXPECT_FALSE(serialize(Action::WriteText("lost"), out));
    EXPECT_TRUE(out.str().empty());
}

TEST(Serialize, RejectingSinkGetsNoPartialAction) {
    LimitedBuf buf(8);
    std::ostream out(&buf);

    EXPECT_FALSE(serialize(Action::MoveAbsolute(at(1, 2)), out));
    EXPECT_TRUE(buf.data().empty());
}

TEST(Serialize, SinkThatAcceptsPartOfAWriteKeepsThePrefix) {
    CharLimitedBuf buf(8);
    std::ostream out(&buf);

    EXPECT_FALSE(serialize(Action::MoveAbsolute(at(1, 2)), out));
    EXPECT_EQ(buf.data(), "m 1.0000");
}

TEST(ActionWriter, NothingFollowsAPartiallyWrittenLine) {
    CharLimitedBuf buf(10);
    std::ostream out(&buf);
    ActionWriter writer(&out);

    Action::WriteText("ab").accept(writer);      // "w ab\n", 5 bytes
    Action::WriteText("cdef").accept(writer);    // 5 of "w cdef\n" fit
    out.clear();
    Action::WriteText("g").accept(writer);

    EXPECT_FALSE(writer.ok());
    EXPECT_EQ(writer.linesWritten(), 1u);
    EXPECT_EQ(buf.data(), "w ab\nw cde");
}

// --- ActionWriter ---

TEST(ActionWriter, WritesOneLinePerAction) {
    std::ostringstream out;
    ActionWriter writer(&out);
    Action::MoveAbsolute(at(1, 2)).accept(writer);
    Action::WriteText("x").accept(writer);

    EXPECT_TRUE(writer.ok());
    EXPECT_EQ(writer.linesWritten(), 2u);
    EXPECT_EQ(out.str(), "m 1.0000 2.0000\nw x\n");
}

TEST(ActionWriter, StopsAfterFirstFailure) {
    // Room for the first line only.
    LimitedBuf buf(12);
    std::ostream out(&buf);
    ActionWriter writer(&out);

    Action::WriteText("first").accept(writer);     // "w first\n", 8 bytes
    Action::WriteText("second").accept(writer);    // would exceed capacity
    EXPECT_FALSE(writer.ok());

    out.clear();
    Action::WriteText("x").accept(writer);         // fits, but writer has failed

    EXPECT_EQ(writer.linesWritten(), 1u);
    EXPECT_EQ(buf.data(), "w first\n");
}

TEST(ActionWriter, CommittedActionsSurviveFailedSerialization) {
    ActionBuffer buffer;
    buffer.append(Action::MoveAbsolute(at(1, 1)));
    buffer.append(Action::WriteText("kept"));
    auto list = buffer.finish();

    std::ostringstream bad;
    bad.setstate(std::ios::badbit);
    EXPECT_FALSE(list->serialize(bad));

    ASSERT_EQ(list->size(), 2u);
    std::ostringstream good;
    EXPECT_TRUE(list->serialize(good));
    EXPECT_EQ(good.str(), "m 1.0000 1.0000\nw kept\n");
}
