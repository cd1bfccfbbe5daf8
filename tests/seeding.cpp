#include "seed_store_error.hpp"
#include "transfer_error.hpp"
#include "random.hpp"
#include "test_util.hpp"

#include <cassert>
#include <stdexcept>

using namespace shoal;
using namespace shoal_test;

namespace {

const channel_ref channel = "0xowner/photos";
const channel_ref other_channel = "0xowner/music";

using protocol::message_type;

settings persisting_settings(const path& dir)
{
    auto s = fast_settings();
    s.seed_store.seed_store_path = dir;
    return s;
}

void test_upload()
{
    asio::io_context ios;
    message_bus bus(ios);
    test_peer seeder(ios, bus, "0xseed");

    const auto bytes = make_bytes(50 * 1024);
    const auto md = seeder.upload(ios, channel, bytes, "cat.jpg");
    assert(is_valid_file_id(md.file_id));
    assert(md.file_name == "cat.jpg");
    assert(md.num_pieces == 4);
    assert(seeder.engine->is_seeding(md.file_id));
    assert(!seeder.engine->is_downloading(md.file_id));
    assert(seeder.engine->num_seeded_files() == 1);
    assert(equal_bytes(*seeder.engine->get_file(md.file_id), bytes));

    const auto* hashed = seeder.find_alert<file_hashed_alert>();
    assert(hashed);
    assert(hashed->channel == channel);
    assert(hashed->metadata == md);

    // an upload is not announced on its own, the metadata is shared out of band
    run_for(ios, std::chrono::milliseconds(50));
    assert(bus.count(message_type::source_announce) == 0);

    // the same bytes uploaded again become a different file
    const auto again = seeder.upload(ios, channel, bytes, "cat.jpg");
    assert(again.file_id != md.file_id);
    assert(again.piece_hashes == md.piece_hashes);
    assert(seeder.engine->num_seeded_files() == 2);
}

void test_failed_upload()
{
    asio::io_context ios;
    message_bus bus(ios);
    auto s = fast_settings();
    s.max_file_size = 64 * 1024;
    test_peer seeder(ios, bus, "0xseed", s);

    error_code upload_error;
    bool done = false;
    seeder.engine->upload_file(channel, make_memory_source({}), "empty.txt", "text/plain",
            [&](const error_code& error, const file_metadata&) {
                upload_error = error;
                done = true;
            });
    const bool finished = run_until(ios, [&] { return done; });
    assert(finished);
    assert(upload_error == transfer_errc::empty_file);
    const auto* failed = seeder.find_alert<hashing_failed_alert>();
    assert(failed);
    assert(failed->file_name == "empty.txt");
    assert(failed->error == transfer_errc::empty_file);

    done = false;
    seeder.engine->upload_file(channel, make_memory_source(make_bytes(64 * 1024 + 1)),
            "big.bin", "application/octet-stream",
            [&](const error_code& error, const file_metadata&) {
                upload_error = error;
                done = true;
            });
    run_until(ios, [&] { return done; });
    assert(upload_error == transfer_errc::file_too_large);
    assert(seeder.count_alerts<hashing_failed_alert>() == 2);
    assert(seeder.engine->num_seeded_files() == 0);

    bool thrown = false;
    try {
        seeder.engine->upload_file(channel, nullptr, "null", "text/plain");
    } catch(const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
}

void test_reannounce()
{
    asio::io_context ios;
    message_bus bus(ios);
    test_peer seeder(ios, bus, "0xseed");

    const auto a = seeder.upload(ios, channel, make_bytes(1000, 1));
    const auto b = seeder.upload(ios, channel, make_bytes(1000, 2));
    const auto c = seeder.upload(ios, other_channel, make_bytes(1000, 3));

    assert(seeder.engine->reannounce_for_channel(channel) == 2);
    assert(seeder.engine->reannounce_for_channel("0xowner/empty") == 0);
    run_for(ios, std::chrono::milliseconds(20));
    assert(bus.count_from("0xseed", message_type::source_announce) == 2);
    for(const auto& m : bus.history) {
        const auto msg = m.decode();
        assert(m.channel == channel);
        assert(msg.file_id == a.file_id || msg.file_id == b.file_id);
        assert(msg.file_id != c.file_id);
        assert(msg.peer_id == "0xseed");
    }

    auto s = fast_settings();
    s.auto_seed_on_join = false;
    message_bus quiet_bus(ios);
    test_peer quiet(ios, quiet_bus, "0xquiet", s);
    quiet.upload(ios, channel, make_bytes(1000));
    assert(quiet.engine->reannounce_for_channel(channel) == 0);
    run_for(ios, std::chrono::milliseconds(20));
    assert(quiet_bus.history.empty());
}

void test_source_requests()
{
    asio::io_context ios;
    message_bus bus(ios);
    test_peer seeder(ios, bus, "0xSeed");
    const auto md = seeder.upload(ios, channel, make_bytes(1000));

    bus.publish(sent_message{"0xother", channel, "",
            protocol::encode_source_request(md.file_id)});
    bus.publish(sent_message{"0xother", channel, "",
            protocol::encode_source_request(random_uuid())});
    run_for(ios, std::chrono::milliseconds(20));

    assert(bus.count_from("0xSeed", message_type::source_announce) == 1);
    for(const auto& m : bus.history) {
        if(m.sender != "0xSeed") {
            continue;
        }
        const auto msg = m.decode();
        assert(msg.file_id == md.file_id);
        assert(msg.peer_id == "0xSeed");
        // answers go to the channel the request came from
        assert(m.channel == channel);
    }

    // a request for a piece that doesn't exist is ignored
    bus.publish(sent_message{"0xother", channel, "",
            protocol::encode_piece_request(md.file_id, md.num_pieces, "0xseed")});
    run_for(ios, std::chrono::milliseconds(20));
    assert(bus.count(message_type::file_piece) == 0);

    bus.publish(sent_message{"0xother", channel, "",
            protocol::encode_piece_request(md.file_id, 0, "0xseed")});
    run_for(ios, std::chrono::milliseconds(20));
    assert(bus.count_from("0xSeed", message_type::file_piece) == 1);
}

void test_persistence_across_restarts()
{
    const auto dir = make_temp_dir("seeding-restart");
    const auto s = persisting_settings(dir);
    asio::io_context ios;
    message_bus bus(ios);
    test_peer seeder(ios, bus, "0xseed", s);

    const auto bytes = make_bytes(40 * 1024);
    const auto md = seeder.upload(ios, channel, bytes);
    const bool persisted = run_until(
            ios, [&] { return seeder.find_alert<seed_persisted_alert>(); });
    assert(persisted);
    assert(seeder.find_alert<seed_persisted_alert>()->file_id == md.file_id);
    assert(seeder.engine->storage_stats().num_records == 1);
    assert(seeder.engine->storage_stats().used_bytes == int64_t(bytes.size()));
    const auto records = seeder.engine->seed_records_for_channel(channel);
    assert(records.size() == 1);
    assert(records[0].metadata == md);
    assert(records[0].privacy == channel_privacy::open);

    seeder.stop();
    seeder.alerts.clear();
    seeder.start(ios, s);

    const auto* loaded = seeder.find_alert<seeds_loaded_alert>();
    assert(loaded);
    assert(loaded->num_loaded == 1);
    assert(loaded->num_expired == 0);
    assert(seeder.engine->is_seeding(md.file_id));
    assert(equal_bytes(*seeder.engine->get_file(md.file_id), bytes));

    // the restored file is served like any other
    test_peer leecher(ios, bus, "0xleech");
    leecher.engine->start_download(channel, md);
    const bool completed = run_until(
            ios, [&] { return leecher.find_alert<download_complete_alert>(); });
    assert(completed);
    assert(equal_bytes(*leecher.engine->get_file(md.file_id), bytes));

    // persisting the same file again is a no-op
    const auto stats = seeder.engine->storage_stats();
    seeder.stop();
    seeder.start(ios, s);
    assert(seeder.engine->storage_stats().num_records == stats.num_records);
    assert(seeder.engine->storage_stats().used_bytes == stats.used_bytes);

    fs::remove_all(dir);
}

void test_downloads_are_persisted()
{
    const auto dir = make_temp_dir("seeding-download");
    asio::io_context ios;
    message_bus bus(ios);
    test_peer seeder(ios, bus, "0xseed");
    test_peer leecher(ios, bus, "0xleech", persisting_settings(dir));

    const auto bytes = make_bytes(20 * 1024);
    const auto md = seeder.upload(ios, channel, bytes);
    leecher.engine->start_download(channel, md);
    const bool persisted = run_until(
            ios, [&] { return leecher.find_alert<seed_persisted_alert>(); });
    assert(persisted);
    assert(leecher.find_alert<download_complete_alert>());
    assert(leecher.engine->seed_records_for_channel(channel).size() == 1);
    assert(leecher.engine->seed_records_for_channel(other_channel).empty());

    fs::remove_all(dir);
}

void test_private_channels_are_not_persisted()
{
    const auto dir = make_temp_dir("seeding-private");
    asio::io_context ios;
    message_bus bus(ios);
    test_peer seeder(ios, bus, "0xseed", persisting_settings(dir));
    seeder.directory.restricted_channels.insert(channel);

    const auto md = seeder.upload(ios, channel, make_bytes(5000));
    run_for(ios, std::chrono::milliseconds(100));
    assert(seeder.engine->is_seeding(md.file_id));
    assert(!seeder.find_alert<seed_persisted_alert>());
    assert(!seeder.find_alert<seed_persist_failed_alert>());
    assert(seeder.engine->storage_stats().num_records == 0);

    // but it is still served, with the channel's key
    assert(seeder.engine->reannounce_for_channel(channel) == 1);
    run_for(ios, std::chrono::milliseconds(20));
    assert(bus.history.back().key == "key:" + channel);

    // removing it only stops seeding
    error_code error;
    seeder.engine->remove_seed_file(md.file_id, error);
    assert(!error);
    assert(!seeder.engine->is_seeding(md.file_id));

    fs::remove_all(dir);
}

void test_eviction()
{
    const auto dir = make_temp_dir("seeding-eviction");
    auto s = persisting_settings(dir);
    s.seed_store.max_seed_storage = 100 * 1024;
    asio::io_context ios;
    message_bus bus(ios);
    test_peer seeder(ios, bus, "0xseed", s);

    const auto a = seeder.upload(ios, channel, make_bytes(60 * 1024, 1));
    run_until(ios, [&] { return seeder.count_alerts<seed_persisted_alert>() == 1; });
    const auto b = seeder.upload(ios, channel, make_bytes(60 * 1024, 2));
    const bool evicted
            = run_until(ios, [&] { return seeder.find_alert<seed_evicted_alert>(); });
    assert(evicted);
    run_until(ios, [&] { return seeder.count_alerts<seed_persisted_alert>() == 2; });

    assert(seeder.find_alert<seed_evicted_alert>()->file_id == a.file_id);
    assert(!seeder.engine->is_seeding(a.file_id));
    assert(seeder.engine->get_file(a.file_id) == nullptr);
    assert(seeder.engine->is_seeding(b.file_id));
    const auto stats = seeder.engine->storage_stats();
    assert(stats.num_records == 1);
    assert(stats.used_bytes == 60 * 1024);
    assert(stats.max_bytes == 100 * 1024);

    // a file that could never fit is seeded but not persisted
    const auto c = seeder.upload(ios, channel, make_bytes(120 * 1024, 3));
    const bool failed = run_until(
            ios, [&] { return seeder.find_alert<seed_persist_failed_alert>(); });
    assert(failed);
    const auto* alert = seeder.find_alert<seed_persist_failed_alert>();
    assert(alert->file_id == c.file_id);
    assert(alert->error == seed_store_errc::quota_exceeded);
    assert(seeder.engine->is_seeding(c.file_id));
    assert(seeder.engine->is_seeding(b.file_id));
    assert(seeder.count_alerts<seed_evicted_alert>() == 1);

    fs::remove_all(dir);
}

void test_removing_seed_files()
{
    const auto dir = make_temp_dir("seeding-remove");
    asio::io_context ios;
    message_bus bus(ios);
    test_peer seeder(ios, bus, "0xseed", persisting_settings(dir));

    const auto a = seeder.upload(ios, channel, make_bytes(3000, 1));
    const auto b = seeder.upload(ios, channel, make_bytes(3000, 2));
    const auto c = seeder.upload(ios, other_channel, make_bytes(3000, 3));
    run_until(ios, [&] { return seeder.count_alerts<seed_persisted_alert>() == 3; });
    assert(seeder.engine->storage_stats().num_records == 3);

    error_code error;
    seeder.engine->remove_seed_file(a.file_id, error);
    assert(!error);
    assert(!seeder.engine->is_seeding(a.file_id));
    assert(seeder.engine->storage_stats().num_records == 2);

    seeder.engine->remove_seed_file(a.file_id, error);
    assert(error == seed_store_errc::record_not_found);

    seeder.engine->clear_seed_files(error);
    assert(!error);
    assert(!seeder.engine->is_seeding(b.file_id));
    assert(!seeder.engine->is_seeding(c.file_id));
    assert(seeder.engine->num_seeded_files() == 0);
    const auto stats = seeder.engine->storage_stats();
    assert(stats.num_records == 0);
    assert(stats.used_bytes == 0);

    // nothing comes back after a restart
    seeder.stop();
    seeder.alerts.clear();
    seeder.start(ios, persisting_settings(dir));
    assert(seeder.find_alert<seeds_loaded_alert>()->num_loaded == 0);

    fs::remove_all(dir);
}

void test_removing_files_being_persisted()
{
    const auto dir = make_temp_dir("seeding-remove-pending");
    asio::io_context ios;
    message_bus bus(ios);
    test_peer seeder(ios, bus, "0xseed", persisting_settings(dir));

    // the record is written in the background, so it is still pending when the
    // upload handler runs
    file_metadata removed;
    file_metadata cleared;
    int num_done = 0;
    seeder.engine->upload_file(channel, make_memory_source(make_bytes(30 * 1024, 1)),
            "removed.bin", "application/octet-stream",
            [&](const error_code& error, const file_metadata& metadata) {
                assert(!error);
                removed = metadata;
                error_code ec;
                seeder.engine->remove_seed_file(metadata.file_id, ec);
                assert(!ec);
                ++num_done;
            });
    seeder.engine->upload_file(channel, make_memory_source(make_bytes(30 * 1024, 2)),
            "cleared.bin", "application/octet-stream",
            [&](const error_code& error, const file_metadata& metadata) {
                assert(!error);
                cleared = metadata;
                error_code ec;
                seeder.engine->clear_seed_files(ec);
                assert(!ec);
                ++num_done;
            });
    const bool finished = run_until(ios,
            [&] { return seeder.count_alerts<seed_persist_failed_alert>() == 2; });
    assert(finished);
    assert(num_done == 2);
    for(const auto& a : seeder.alerts) {
        if(auto* p = alert_cast<seed_persist_failed_alert>(a.get())) {
            assert(p->error == seed_store_errc::write_cancelled);
        }
    }
    assert(!seeder.find_alert<seed_persisted_alert>());
    assert(!seeder.engine->is_seeding(removed.file_id));
    assert(!seeder.engine->is_seeding(cleared.file_id));
    assert(seeder.engine->storage_stats().num_records == 0);
    assert(seeder.engine->storage_stats().used_bytes == 0);

    seeder.stop();
    seeder.alerts.clear();
    seeder.start(ios, persisting_settings(dir));
    assert(seeder.find_alert<seeds_loaded_alert>()->num_loaded == 0);
    assert(!seeder.engine->is_seeding(removed.file_id));
    assert(fs::is_empty(dir));

    fs::remove_all(dir);
}

void test_engine_shutdown_with_pending_completions()
{
    const auto dir = make_temp_dir("seeding-shutdown");
    auto s = persisting_settings(dir);
    s.seed_store.max_seed_storage = 10 * 1024;
    asio::io_context ios;
    message_bus bus(ios);
    test_peer seeder(ios, bus, "0xseed", s);

    // the refusal of the oversized file is queued along with the upload's result,
    // and the engine is gone before it is delivered
    bool uploaded = false;
    seeder.engine->upload_file(channel, make_memory_source(make_bytes(20 * 1024)),
            "big.bin", "application/octet-stream",
            [&](const error_code& error, const file_metadata&) {
                assert(!error);
                uploaded = true;
            });
    while(!uploaded) {
        ios.run_one();
    }
    seeder.stop();
    assert(seeder.find_alert<file_hashed_alert>());
    run_for(ios, std::chrono::milliseconds(50));
    assert(!seeder.find_alert<seed_persist_failed_alert>());

    fs::remove_all(dir);
}

} // namespace

int main()
{
    test_upload();
    test_failed_upload();
    test_reannounce();
    test_source_requests();
    test_persistence_across_restarts();
    test_downloads_are_persisted();
    test_private_channels_are_not_persisted();
    test_eviction();
    test_removing_seed_files();
    test_removing_files_being_persisted();
    test_engine_shutdown_with_pending_completions();
}
