// Copyright (C) 2025, Moritz Scheer

#include <gtest/gtest.h>

#include <cerrno>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "core/async.hpp"
#include "core/scheduler.hpp"
#include "middleware/buffer.hpp"
#include "middleware/error.hpp"
#include "middleware/webt/decoder.hpp"
#include "middleware/webt/encoder.hpp"
#include "middleware/webt/stream.hpp"
#include "step.hpp"

namespace wtwire
{
namespace networking
{
namespace webt
{
namespace
{

session_id_t make_session_id(uint32_t id)
{
    session_id_t session_id;
    EXPECT_EQ(session_id_t::try_from_varint(varint_t(id), session_id), 0);
    return session_id;
}

std::vector<stream_header_t> sample_headers()
{
    std::vector<stream_header_t> headers = {
        stream_header_t::new_control(),
        stream_header_t::new_qpack_encoder(),
        stream_header_t::new_qpack_decoder(),
        stream_header_t::new_webtransport(make_session_id(0)),
        stream_header_t::new_webtransport(make_session_id(4)),
        stream_header_t::new_webtransport(make_session_id(1073741824)),
    };

    stream_header_t exercise;
    EXPECT_EQ(stream_header_t::new_exercise(varint_t(0x21 + 0x1f * 3), exercise), 0);
    headers.push_back(exercise);

    varint_t max;
    EXPECT_EQ(varint_t::from_u64(varint_t::MAX - 3, max), 0);

    session_id_t max_session;
    EXPECT_EQ(session_id_t::try_from_varint(max, max_session), 0);
    headers.push_back(stream_header_t::new_webtransport(max_session));

    return headers;
}

/* WebTransport discriminant followed by session id 1, a server-initiated bidirectional stream */
std::vector<uint8_t> invalid_session_bytes()
{
    std::vector<uint8_t> out;
    vector_writer_t writer(out);

    EXPECT_EQ(writer.put_varint(varint_t(STREAM_TYPE_UNI_WEBTRANSPORT_STREAM)), 0);
    EXPECT_EQ(writer.put_varint(varint_t(1)), 0);

    return out;
}

std::vector<uint8_t> unknown_stream_bytes()
{
    std::vector<uint8_t> out;
    vector_writer_t writer(out);

    EXPECT_EQ(writer.put_varint(varint_t(0x42)), 0);
    EXPECT_EQ(writer.put_varint(varint_t(0x25)), 0);

    return out;
}

void expect_same(const stream_header_t &a, const stream_header_t &b)
{
    EXPECT_TRUE(a.kind() == b.kind());
    EXPECT_EQ(a.session_id().has_value(), b.session_id().has_value());

    if (a.session_id() && b.session_id())
    {
        EXPECT_TRUE(*a.session_id() == *b.session_id());
    }
}

/* ------------------------------------------------ STREAM KIND ----------------------------------------------------- */

TEST(StreamKind, ExerciseArithmetic)
{
    EXPECT_FALSE(stream_kind_t::is_id_exercise(varint_t(0x00)));
    EXPECT_FALSE(stream_kind_t::is_id_exercise(varint_t(0x20)));
    EXPECT_TRUE(stream_kind_t::is_id_exercise(varint_t(0x21)));
    EXPECT_FALSE(stream_kind_t::is_id_exercise(varint_t(0x22)));
    EXPECT_TRUE(stream_kind_t::is_id_exercise(varint_t(0x40)));
    EXPECT_FALSE(stream_kind_t::is_id_exercise(varint_t(0x42)));
    EXPECT_TRUE(stream_kind_t::is_id_exercise(varint_t(0x21 + 0x1f * 1000)));
}

TEST(StreamKind, ParseDiscriminants)
{
    stream_kind_t kind;

    ASSERT_EQ(stream_kind_t::parse(varint_t(0x00), kind), 0);
    EXPECT_EQ(kind.tag, stream_kind_t::CONTROL);

    ASSERT_EQ(stream_kind_t::parse(varint_t(0x02), kind), 0);
    EXPECT_EQ(kind.tag, stream_kind_t::QPACK_ENCODER);

    ASSERT_EQ(stream_kind_t::parse(varint_t(0x03), kind), 0);
    EXPECT_EQ(kind.tag, stream_kind_t::QPACK_DECODER);

    ASSERT_EQ(stream_kind_t::parse(varint_t(0x54), kind), 0);
    EXPECT_EQ(kind.tag, stream_kind_t::WEBTRANSPORT);

    ASSERT_EQ(stream_kind_t::parse(varint_t(0x40), kind), 0);
    EXPECT_EQ(kind.tag, stream_kind_t::EXERCISE);
    EXPECT_EQ(kind.id().value(), 0x40u);

    EXPECT_EQ(stream_kind_t::parse(varint_t(0x01), kind), WTWIRE_ERR_UNKNOWN_STREAM);
    EXPECT_EQ(stream_kind_t::parse(varint_t(0x41), kind), WTWIRE_ERR_UNKNOWN_STREAM);
    EXPECT_EQ(stream_kind_t::parse(varint_t(0x42), kind), WTWIRE_ERR_UNKNOWN_STREAM);
}

/* ------------------------------------------------ CONSTRUCTION ---------------------------------------------------- */

TEST(StreamHeader, Control)
{
    stream_header_t header = stream_header_t::new_control();

    EXPECT_EQ(header.kind().tag, stream_kind_t::CONTROL);
    EXPECT_FALSE(header.session_id().has_value());
    EXPECT_EQ(header.write_size(), 1u);
}

TEST(StreamHeader, WebTransport)
{
    session_id_t session_id = make_session_id(0);
    stream_header_t header = stream_header_t::new_webtransport(session_id);

    EXPECT_EQ(header.kind().tag, stream_kind_t::WEBTRANSPORT);
    ASSERT_TRUE(header.session_id().has_value());
    EXPECT_TRUE(*header.session_id() == session_id);
    EXPECT_EQ(header.write_size(), 3u);
}

TEST(StreamHeader, ExerciseRequiresGreasingId)
{
    stream_header_t header = stream_header_t::new_control();

    EXPECT_EQ(stream_header_t::new_exercise(varint_t(0x42), header), WTWIRE_ERR_UNKNOWN_STREAM);
    EXPECT_EQ(header.kind().tag, stream_kind_t::CONTROL);

    ASSERT_EQ(stream_header_t::new_exercise(varint_t(0x21), header), 0);
    EXPECT_EQ(header.kind().tag, stream_kind_t::EXERCISE);
    EXPECT_FALSE(header.session_id().has_value());
}

/* ------------------------------------------------ SYNCHRONOUS ----------------------------------------------------- */

TEST(StreamHeader, RoundTrip)
{
    for (const stream_header_t &header : sample_headers())
    {
        std::vector<uint8_t> out;
        vector_writer_t writer(out);

        ASSERT_EQ(header.write(writer), 0);
        EXPECT_EQ(out.size(), header.write_size());
        EXPECT_LE(out.size(), stream_header_t::MAX_SIZE);

        reader_t reader(out.data(), out.size());
        stream_header_t read;

        ASSERT_EQ(stream_header_t::read(reader, read), 0);
        EXPECT_EQ(reader.capacity(), 0u);
        expect_same(header, read);
    }
}

TEST(StreamHeader, RoundTripFromBuffer)
{
    for (const stream_header_t &header : sample_headers())
    {
        uint8_t buffer[stream_header_t::MAX_SIZE];
        writer_t writer(buffer, sizeof(buffer));

        ASSERT_EQ(header.write_to_buffer(writer), 0);
        EXPECT_EQ(writer.offset(), header.write_size());

        reader_t reader(buffer, writer.offset());
        stream_header_t read;

        ASSERT_EQ(stream_header_t::read_from_buffer(reader, read), 0);
        EXPECT_EQ(reader.offset(), header.write_size());
        expect_same(header, read);
    }
}

TEST(StreamHeader, ReadIncomplete)
{
    for (const stream_header_t &header : sample_headers())
    {
        std::vector<uint8_t> out;
        vector_writer_t writer(out);
        ASSERT_EQ(header.write(writer), 0);

        for (size_t len = 0; len < out.size(); len++)
        {
            reader_t reader(out.data(), len);
            stream_header_t read;

            EXPECT_EQ(stream_header_t::read_from_buffer(reader, read), WTWIRE_ERR_END_OF_BUFFER);
            EXPECT_EQ(reader.offset(), 0u);
            EXPECT_EQ(reader.capacity(), len);
        }
    }
}

TEST(StreamHeader, RawReadTruncatedDiscriminantLeavesOffset)
{
    const uint8_t data[] = {0x40};
    reader_t reader(data, sizeof(data));

    stream_header_t read;
    EXPECT_EQ(stream_header_t::read(reader, read), WTWIRE_ERR_END_OF_BUFFER);
    EXPECT_EQ(reader.capacity(), 1u);
}

TEST(StreamHeader, RawReadMayConsumeDiscriminant)
{
    std::vector<uint8_t> out;
    vector_writer_t writer(out);
    ASSERT_EQ(stream_header_t::new_webtransport(make_session_id(4)).write(writer), 0);

    reader_t reader(out.data(), out.size() - 1);
    stream_header_t read;

    EXPECT_EQ(stream_header_t::read(reader, read), WTWIRE_ERR_END_OF_BUFFER);
    EXPECT_EQ(reader.offset(), 2u);
}

TEST(StreamHeader, UnknownStream)
{
    std::vector<uint8_t> data = unknown_stream_bytes();

    reader_t raw(data.data(), data.size());
    stream_header_t read;
    EXPECT_EQ(stream_header_t::read(raw, read), WTWIRE_ERR_UNKNOWN_STREAM);

    reader_t reader(data.data(), data.size());
    EXPECT_EQ(stream_header_t::read_from_buffer(reader, read), WTWIRE_ERR_UNKNOWN_STREAM);
    EXPECT_EQ(reader.offset(), 0u);

    /* the bytes are still there for whoever handles the rejection */
    varint_t varint;
    ASSERT_EQ(reader.get_varint(varint), 0);
    EXPECT_EQ(varint.value(), 0x42u);
}

TEST(StreamHeader, InvalidSessionId)
{
    std::vector<uint8_t> data = invalid_session_bytes();

    reader_t raw(data.data(), data.size());
    stream_header_t read;
    EXPECT_EQ(stream_header_t::read(raw, read), WTWIRE_ERR_INVALID_SESSION_ID);

    reader_t reader(data.data(), data.size());
    EXPECT_EQ(stream_header_t::read_from_buffer(reader, read), WTWIRE_ERR_INVALID_SESSION_ID);
    EXPECT_EQ(reader.offset(), 0u);
    EXPECT_EQ(reader.capacity(), data.size());
}

TEST(StreamHeader, ReadFromBufferLeavesTrailingBytes)
{
    std::vector<uint8_t> out;
    vector_writer_t writer(out);

    ASSERT_EQ(stream_header_t::new_webtransport(make_session_id(8)).write(writer), 0);
    ASSERT_EQ(writer.put_varint(varint_t(37)), 0);

    reader_t reader(out.data(), out.size());
    stream_header_t read;

    ASSERT_EQ(stream_header_t::read_from_buffer(reader, read), 0);
    EXPECT_EQ(reader.capacity(), 1u);

    varint_t varint;
    ASSERT_EQ(reader.get_varint(varint), 0);
    EXPECT_EQ(varint.value(), 37u);
}

TEST(StreamHeader, WriteToBufferChecksCapacity)
{
    stream_header_t header = stream_header_t::new_webtransport(make_session_id(1073741824));
    ASSERT_EQ(header.write_size(), 10u);

    uint8_t buffer[9] = {};
    writer_t writer(buffer, sizeof(buffer));

    EXPECT_EQ(header.write_to_buffer(writer), WTWIRE_ERR_END_OF_BUFFER);
    EXPECT_EQ(writer.offset(), 0u);
    EXPECT_EQ(buffer[0], 0x00);

    /* plain write gets the discriminant out before running out of space */
    EXPECT_EQ(header.write(writer), WTWIRE_ERR_END_OF_BUFFER);
    EXPECT_EQ(writer.offset(), 2u);
}

/* ------------------------------------------------ ASYNCHRONOUS ---------------------------------------------------- */

TEST(StreamHeaderAsync, RoundTrip)
{
    for (const stream_header_t &header : sample_headers())
    {
        test::step_sink_t sink;
        write_header_t write(sink, header);

        ASSERT_EQ(scheduler::run(write), 0);
        EXPECT_EQ(sink.written().size(), header.write_size());

        test::step_source_t source(sink.written());
        read_header_t read(source);

        ASSERT_EQ(scheduler::run(read), 0);
        EXPECT_EQ(source.consumed(), header.write_size());
        expect_same(header, read.value());
    }
}

TEST(StreamHeaderAsync, VectorSinkAndSliceSource)
{
    std::vector<uint8_t> out;
    async::vector_sink_t sink(out);

    stream_header_t header = stream_header_t::new_webtransport(make_session_id(12));
    write_header_t write(sink, header);

    ASSERT_EQ(write.poll(), 0);
    EXPECT_EQ(write.poll(), WTWIRE_ERR_INVALID_STATE);

    async::slice_source_t source(out.data(), out.size());
    read_header_t read(source);

    ASSERT_EQ(read.poll(), 0);
    expect_same(header, read.value());
    EXPECT_EQ(read.poll(), WTWIRE_ERR_INVALID_STATE);
}

TEST(StreamHeaderAsync, ReadEof)
{
    std::vector<uint8_t> out;
    vector_writer_t writer(out);
    ASSERT_EQ(stream_header_t::new_control().write(writer), 0);

    out.pop_back();

    test::step_source_t source(out);
    read_header_t read(source);

    int res = scheduler::run(read);
    EXPECT_EQ(res, WTWIRE_ERR_CLOSED);
    EXPECT_TRUE(is_io_error(res));
}

TEST(StreamHeaderAsync, ReadEofInSessionId)
{
    std::vector<uint8_t> out;
    vector_writer_t writer(out);
    ASSERT_EQ(stream_header_t::new_webtransport(make_session_id(1073741824)).write(writer), 0);

    out.pop_back();

    test::step_source_t source(out);
    read_header_t read(source);

    EXPECT_EQ(scheduler::run(read), WTWIRE_ERR_CLOSED);
}

TEST(StreamHeaderAsync, UnknownStream)
{
    test::step_source_t source(unknown_stream_bytes());
    read_header_t read(source);

    int res = scheduler::run(read);
    EXPECT_EQ(res, WTWIRE_ERR_UNKNOWN_STREAM);
    EXPECT_TRUE(is_stream_header_error(res));
    EXPECT_FALSE(is_io_error(res));
}

TEST(StreamHeaderAsync, InvalidSessionId)
{
    test::step_source_t source(invalid_session_bytes());
    read_header_t read(source);

    int res = scheduler::run(read);
    EXPECT_EQ(res, WTWIRE_ERR_INVALID_SESSION_ID);
    EXPECT_TRUE(is_stream_header_error(res));
}

TEST(StreamHeaderAsync, NotConnected)
{
    test::failing_source_t source(-ENOTCONN);
    read_header_t read(source);

    EXPECT_EQ(read.poll(), WTWIRE_ERR_NOT_CONNECTED);
}

TEST(StreamHeaderAsync, WriteFailsWhenSinkCloses)
{
    test::step_sink_t sink(2);

    write_header_t write(sink, stream_header_t::new_webtransport(make_session_id(4)));

    EXPECT_EQ(scheduler::run(write), WTWIRE_ERR_CLOSED);
    EXPECT_EQ(sink.written().size(), 2u);
}

TEST(StreamHeaderAsync, LogsRejectedHeader)
{
    std::vector<std::string> lines;

    settings_t settings;
    settings_default(&settings);
    settings.user_data = &lines;
    settings.log_printf = [](void *user_data, const char *format, ...) {
        char line[256];

        va_list ap;
        va_start(ap, format);
        vsnprintf(line, sizeof(line), format, ap);
        va_end(ap);

        static_cast<std::vector<std::string> *>(user_data)->push_back(line);
    };

    test::step_source_t source(unknown_stream_bytes());
    read_header_t read(source, &settings);

    EXPECT_EQ(scheduler::run(read), WTWIRE_ERR_UNKNOWN_STREAM);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("0x42"), std::string::npos);
}

/* ------------------------------------------------ CONSISTENCY ----------------------------------------------------- */

TEST(StreamHeader, EntryPointsAgreeOnDiscriminants)
{
    for (uint32_t id = 0; id < 0x200; id++)
    {
        std::vector<uint8_t> out;
        vector_writer_t writer(out);
        ASSERT_EQ(writer.put_varint(varint_t(id)), 0);
        ASSERT_EQ(writer.put_varint(varint_t(4)), 0);

        reader_t raw(out.data(), out.size());
        stream_header_t raw_header;
        int raw_res = stream_header_t::read(raw, raw_header);

        reader_t buffered(out.data(), out.size());
        stream_header_t buffered_header;
        int buffered_res = stream_header_t::read_from_buffer(buffered, buffered_header);

        async::slice_source_t source(out.data(), out.size());
        read_header_t read(source);
        int async_res = scheduler::run(read);

        EXPECT_EQ(raw_res, buffered_res) << "discriminant " << id;
        EXPECT_EQ(raw_res, async_res) << "discriminant " << id;

        if (raw_res == 0)
        {
            expect_same(raw_header, buffered_header);
            expect_same(raw_header, read.value());
        }
    }
}

}; // namespace
}; // namespace webt
}; // namespace networking
}; // namespace wtwire
