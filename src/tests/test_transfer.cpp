#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "archive/zip.hpp"
#include "dcc/offer.hpp"
#include "dcc/transfer.hpp"
#include "errors.hpp"
#include "tests/fakes.hpp"

using namespace ircbooks;
using namespace ircbooks::testing;

namespace {

auto offer_from(const FakeDccPeer& peer, std::string_view filename) -> dcc::DccOffer
{
    auto offer = dcc::unpack_dcc_send(peer.offer(filename), "Peer");
    assert(offer);
    return *offer;
}

auto no_partials(const Config& config, const fs::path& destination) -> bool
{
    const auto temp = config.temp_dir_for(destination);
    return not fs::exists(temp) or fs::is_empty(temp);
}

}  // namespace

void test_transfer_state();
void test_zip_reader();
void test_receive_whole_file();
void test_receive_short_file();
void test_receive_stalled_file();
void test_receive_archive();
void test_receive_archive_without_book();
void test_cancel_transfer();

void test_transfers()
{
    test_transfer_state();
    test_zip_reader();
    test_receive_whole_file();
    test_receive_short_file();
    test_receive_stalled_file();
    test_receive_archive();
    test_receive_archive_without_book();
    test_cancel_transfer();
}

void test_transfer_state()
{
    using dcc::TransferPhase;

    dcc::DccOffer offer{.filename = "a.epub", .ip = "127.0.0.1", .port = 1, .size = 10};
    dcc::TransferState state(offer, "a.epub.part");

    assert(state.phase() == TransferPhase::Pending);
    assert(not state.advance(TransferPhase::Succeeded));  // never unverified
    assert(not state.advance(TransferPhase::Extracting));
    assert(state.advance(TransferPhase::Transferring));
    assert(not state.advance(TransferPhase::Pending));

    state.add_received(10);
    assert(state.received() == state.expected_size());

    assert(state.advance(TransferPhase::Verifying));
    assert(state.advance(TransferPhase::Extracting));
    assert(state.advance(TransferPhase::Succeeded));
    assert(state.is_final());
    assert(not state.advance(TransferPhase::Failed));

    dcc::TransferState failing(offer, "b.epub.part");
    assert(failing.advance(TransferPhase::Transferring));

    auto error = failing.fail(TransferErrorCode::STALLED, "no data");
    assert(error.code == TransferErrorCode::STALLED);
    assert(failing.phase() == TransferPhase::Failed);
    assert(failing.failure() and failing.failure()->code == TransferErrorCode::STALLED);

    // First failure wins
    failing.fail(TransferErrorCode::IO_FAILURE, "later");
    assert(failing.failure()->code == TransferErrorCode::STALLED);
}

void test_zip_reader()
{
    const auto dir = scratch_dir("zip");
    const std::string text = "first line\r\nsecond line\nthird";

    write_file(
      dir / "mixed.zip",
      make_zip({
        {.name = "nested/dir/book.EPUB", .data = std::string(5000, 'e')},
        {.name = "notes.txt", .data = text, .deflate = false},
        {.name = "nested/", .data = "", .deflate = false},
      })
    );

    assert(archive::is_zip(dir / "mixed.zip"));

    auto reader = archive::ZipReader::open(dir / "mixed.zip");
    assert(reader);
    assert(reader->entries().size() == 3);
    assert(reader->entries()[0].method == archive::ZipEntry::METHOD_DEFLATED);
    assert(reader->entries()[0].basename() == "book.EPUB");
    assert(reader->entries()[2].is_directory());

    auto lines = reader->read_lines(reader->entries()[1]);
    assert(lines);
    assert(*lines == (std::vector<std::string>{"first line", "second line", "third"}));

    auto extracted = archive::extract_matching(dir / "mixed.zip", dir, "epub");
    assert(extracted and extracted->size() == 1);
    assert(extracted->front() == dir / "book.EPUB");
    assert(read_file(dir / "book.EPUB") == std::string(5000, 'e'));

    // Corrupt the CRC of the first local entry's data
    auto broken = make_zip({{.name = "book.epub", .data = "abc", .deflate = false}});
    broken[30 + 9] = 'X';
    write_file(dir / "broken.zip", broken);

    auto crc = archive::extract_matching(dir / "broken.zip", dir, "epub");
    assert(not fs::exists(dir / "book.epub"));
    assert(not crc);

    // A bad later member takes the good earlier one with it
    const auto partial_dir = scratch_dir("zip-partial");
    auto half_bad = make_zip({
      {.name = "a.epub", .data = "aaa", .deflate = false},
      {.name = "b.epub", .data = "bbb", .deflate = false},
    });
    half_bad[(30 + 6 + 3) + 30 + 6] = 'X';  // first data byte of b.epub
    write_file(dir / "half-bad.zip", half_bad);

    auto partial = archive::extract_matching(dir / "half-bad.zip", partial_dir, "epub");
    assert(not partial);
    assert(partial.error() == archive::Error::CRC_MISMATCH);
    assert(fs::is_empty(partial_dir));

    write_file(dir / "plain.epub", "not an archive at all, just some bytes");
    assert(not archive::is_zip(dir / "plain.epub"));
    assert(archive::ZipReader::open(dir / "plain.epub").error() == archive::Error::NOT_AN_ARCHIVE);
}

void test_receive_whole_file()
{
    const auto dir = scratch_dir("whole");
    auto config = test_config();
    config.dcc_buffer_size = 4096;

    const std::string payload(100'000, 'x');
    FakeDccPeer peer(payload);

    dcc::DccTransferEngine engine(config);

    std::uint64_t last_progress = 0;
    auto file = engine.receive(
      offer_from(peer, "Jane Doe - Example Book.epub"), dir, {},
      [&](std::uint64_t received, std::uint64_t total) {
          assert(total == payload.size());
          assert(received > last_progress);
          last_progress = received;
      }
    );

    assert(file);
    assert(file->path == dir / "Jane Doe - Example Book.epub");
    assert(file->size == payload.size());
    assert(file->extracted_members.empty());
    assert(fs::file_size(file->path) == payload.size());
    assert(last_progress == payload.size());
    assert(no_partials(config, dir));
}

void test_receive_short_file()
{
    const auto dir = scratch_dir("short");
    auto config = test_config();

    FakeDccPeer peer(std::string(10'000, 'x'), FakeDccPeer::Mode::SendPart);
    dcc::DccTransferEngine engine(config);

    auto file = engine.receive(offer_from(peer, "short.epub"), dir);

    assert(not file);
    assert(file.error().code == TransferErrorCode::INCOMPLETE);
    assert(not fs::exists(dir / "short.epub"));
    assert(no_partials(config, dir));
}

void test_receive_stalled_file()
{
    const auto dir = scratch_dir("stalled");
    auto config = test_config();

    FakeDccPeer peer(std::string(10'000, 'x'), FakeDccPeer::Mode::Stall);
    dcc::DccTransferEngine engine(config);

    const auto started = std::chrono::steady_clock::now();
    auto file = engine.receive(offer_from(peer, "stalled.epub"), dir);

    assert(not file);
    assert(file.error().code == TransferErrorCode::STALLED);
    assert(std::chrono::steady_clock::now() - started >= config.stall_timeout);
    assert(no_partials(config, dir));

    // Nobody listening at all
    dcc::DccOffer unreachable = offer_from(peer, "x.epub");
    unreachable.port = 1;

    auto refused = engine.receive(unreachable, dir);
    assert(not refused);
    assert(refused.error().code == TransferErrorCode::IO_FAILURE);
}

void test_receive_archive()
{
    const auto dir = scratch_dir("archive");
    auto config = test_config();

    FakeDccPeer peer(make_zip({
      {.name = "Example Book/book.epub", .data = std::string(20'000, 'b')},
      {.name = "Example Book/cover.jpg", .data = std::string(3'000, 'c')},
    }));

    dcc::DccTransferEngine engine(config);
    auto file = engine.receive(offer_from(peer, "Example Book.zip"), dir);

    assert(file);
    assert(file->extracted_members.size() == 1);
    assert(file->path == dir / "book.epub");
    assert(file->size == 20'000);
    assert(fs::exists(dir / "book.epub"));
    assert(not fs::exists(dir / "cover.jpg"));
    assert(not fs::exists(dir / "Example Book.zip"));

    // Asking for the archive itself keeps it packed
    FakeDccPeer again(make_zip({{.name = "book.epub", .data = "abc"}}));
    auto packed = engine.receive(offer_from(again, "packed.zip"), dir, {}, {}, "zip");
    assert(packed and packed->path == dir / "packed.zip");
    assert(archive::is_zip(packed->path));
}

void test_receive_archive_without_book()
{
    const auto dir = scratch_dir("archive-cover");
    auto config = test_config();

    FakeDccPeer peer(make_zip({{.name = "cover.jpg", .data = std::string(3'000, 'c')}}));

    dcc::DccTransferEngine engine(config);
    auto file = engine.receive(offer_from(peer, "Example Book.zip"), dir);

    assert(not file);
    assert(file.error().code == TransferErrorCode::NO_MATCHING_CONTENT);
    assert(file.error().reason() == "no_matching_content");
    assert(not fs::exists(dir / "cover.jpg"));
    assert(not fs::exists(dir / "Example Book.zip"));
}

void test_cancel_transfer()
{
    using namespace std::chrono_literals;

    const auto dir = scratch_dir("cancel");
    auto config = test_config();
    config.stall_timeout = 10'000ms;

    FakeDccPeer peer(std::string(10'000, 'x'), FakeDccPeer::Mode::Stall);
    dcc::DccTransferEngine engine(config);

    std::stop_source session_stop;
    dcc::TransferWorker worker(
      engine, offer_from(peer, "cancelled.epub"), dir, session_stop.get_token()
    );
    worker.start();

    std::this_thread::sleep_for(200ms);
    assert(worker.started());

    // Closing the owning session cancels its transfers
    const auto cancelled_at = std::chrono::steady_clock::now();
    session_stop.request_stop();

    auto file = worker.wait();
    assert(not file);
    assert(file.error().code == TransferErrorCode::CANCELLED);
    assert(std::chrono::steady_clock::now() - cancelled_at < 2s);
    assert(not fs::exists(dir / "cancelled.epub"));
    assert(no_partials(config, dir));

    FakeDccPeer second(std::string(10'000, 'x'), FakeDccPeer::Mode::Stall);
    dcc::TransferWorker direct(engine, offer_from(second, "direct.epub"), dir);
    direct.start();
    std::this_thread::sleep_for(100ms);
    direct.cancel();

    auto result = direct.wait();
    assert(not result and result.error().code == TransferErrorCode::CANCELLED);
    assert(no_partials(config, dir));
}
