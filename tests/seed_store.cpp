#include "seed_store.hpp"
#include "seed_store_error.hpp"
#include "thread_pool.hpp"
#include "test_util.hpp"

#include <cassert>
#include <fstream>
#include <map>
#include <memory>

using namespace shoal;
using namespace shoal_test;

namespace {

seed_record make_record(const file_id_t& id, const int64_t size, const int64_t timestamp,
        const channel_ref& channel = "0xabc/public",
        const channel_privacy privacy = channel_privacy::open)
{
    seed_record r;
    r.metadata.file_id = id;
    r.metadata.file_name = id + ".bin";
    r.metadata.file_size = size;
    r.metadata.piece_size = 1024;
    r.metadata.num_pieces = num_pieces_for(size, 1024);
    r.metadata.piece_hashes.resize(r.metadata.num_pieces);
    r.channel = channel;
    r.privacy = privacy;
    r.timestamp = timestamp;
    return r;
}

struct fixture
{
    asio::io_context ios;
    thread_pool pool{2};
    seed_store_settings settings;

    /** Persists a record and waits for the outcome. */
    error_code persist(seed_store& store, seed_record record, const uint32_t seed = 1)
    {
        const auto bytes = make_bytes(record.metadata.file_size, seed);
        bool done = false;
        error_code result;
        store.async_persist(std::move(record), make_memory_source(bytes),
                [&](const error_code& error) {
                    result = error;
                    done = true;
                });
        const bool finished = run_until(ios, [&] { return done; });
        assert(finished);
        return result;
    }
};

int64_t now_millis()
{
    return to_unix_millis(system_clock::now());
}

void write_garbage(const path& p, const std::string& contents)
{
    std::ofstream out(p, std::ios::binary);
    out << contents;
}

} // namespace

int main()
{
    const int64_t t = now_millis();

    // the record header encoding
    {
        const auto record = make_record("abc", 5000, t, "chan", channel_privacy::restricted);
        const auto encoded = encode_seed_record(record);
        error_code error;
        const auto decoded = decode_seed_record(encoded, error);
        assert(!error);
        assert(decoded.metadata == record.metadata);
        assert(decoded.channel == "chan");
        assert(decoded.privacy == channel_privacy::restricted);
        assert(decoded.timestamp == t);

        auto bad = encoded;
        bad[0] ^= 0xff;
        decode_seed_record(bad, error);
        assert(error == seed_store_errc::corrupt_record);
        const const_view<uint8_t> truncated(encoded.data(), encoded.size() - 3);
        decode_seed_record(truncated, error);
        assert(error == seed_store_errc::corrupt_record);
    }

    // without a path nothing is persisted
    {
        fixture f;
        f.settings.max_seed_storage = 10000;
        seed_store store(f.ios, f.pool, f.settings);
        assert(!store.is_enabled());
        assert(!store.is_eligible(channel_privacy::open));
        assert(f.persist(store, make_record("a", 100, t)) == seed_store_errc::not_eligible);

        int num_expired = -1;
        error_code error;
        assert(store.load(system_clock::now(), num_expired, error).empty());
        assert(!error);
        assert(num_expired == 0);
    }

    // private channels are opt-in
    {
        fixture f;
        f.settings.seed_store_path = make_temp_dir("privacy");
        f.settings.max_seed_storage = 10000;
        seed_store store(f.ios, f.pool, f.settings);
        assert(store.is_eligible(channel_privacy::open));
        assert(!store.is_eligible(channel_privacy::restricted));
        const auto record
                = make_record("secret", 100, t, "chan", channel_privacy::restricted);
        assert(f.persist(store, record) == seed_store_errc::not_eligible);
        assert(!store.contains("secret"));
        assert(!fs::exists(store.data_path("secret")));

        f.settings.persist_private_channels = true;
        assert(store.is_eligible(channel_privacy::restricted));
        assert(!f.persist(store, record));
        assert(store.contains("secret"));
        fs::remove_all(f.settings.seed_store_path);
    }

    // admission control and eviction
    {
        fixture f;
        f.settings.seed_store_path = make_temp_dir("eviction");
        f.settings.max_seed_storage = 3000;
        seed_store store(f.ios, f.pool, f.settings);

        std::vector<file_id_t> evicted;
        store.set_eviction_handler(
                [&](const seed_record& r) { evicted.push_back(r.metadata.file_id); });

        assert(!f.persist(store, make_record("one", 1000, t + 1)));
        assert(!f.persist(store, make_record("two", 1000, t + 2, "other")));
        assert(!f.persist(store, make_record("three", 1000, t + 3)));
        assert(store.get_stats().used_bytes == 3000);
        assert(store.get_stats().num_records == 3);
        assert(fs::exists(store.header_path("two")));
        assert(fs::file_size(store.data_path("two")) == 1000);

        // persisting the same file again is a no-op
        assert(!f.persist(store, make_record("two", 1000, t + 9)));
        assert(store.get_stats().num_records == 3);

        assert(store.records_for_channel("0xabc/public").size() == 2);
        assert(store.records_for_channel("other").size() == 1);

        // larger than the quota: nothing is evicted
        assert(f.persist(store, make_record("huge", 3001, t + 4))
                == seed_store_errc::quota_exceeded);
        assert(evicted.empty());
        assert(store.get_stats().num_records == 3);

        // the oldest are evicted until at least the needed space is freed
        assert(!f.persist(store, make_record("four", 1500, t + 5)));
        assert(evicted.size() == 2);
        assert(evicted[0] == "one" && evicted[1] == "two");
        assert(!store.contains("one") && !store.contains("two"));
        assert(!fs::exists(store.header_path("one")));
        assert(!fs::exists(store.data_path("two")));
        assert(store.contains("three") && store.contains("four"));
        assert(store.get_stats().used_bytes == 2500);
        assert(store.get_stats().used_bytes <= store.get_stats().max_bytes);
        assert(store.records_for_channel("other").empty());

        error_code error;
        store.remove("nope", error);
        assert(error == seed_store_errc::record_not_found);
        store.remove("three", error);
        assert(!error);
        assert(store.get_stats().used_bytes == 1500);
        assert(!fs::exists(store.data_path("three")));

        store.clear(error);
        assert(!error);
        assert(store.get_stats().num_records == 0);
        assert(store.get_stats().used_bytes == 0);
        assert(fs::is_empty(f.settings.seed_store_path));
        fs::remove_all(f.settings.seed_store_path);
    }

    // space reserved by writes in progress can't be evicted: the store refuses
    // the write and its index stays consistent
    {
        fixture f;
        f.settings.seed_store_path = make_temp_dir("reserved");
        f.settings.max_seed_storage = 3000;
        seed_store store(f.ios, f.pool, f.settings);

        int num_done = 0;
        error_code first_error;
        error_code second_error;
        store.async_persist(make_record("first", 2000, t + 1),
                make_memory_source(make_bytes(2000)), [&](const error_code& error) {
                    first_error = error;
                    ++num_done;
                });
        assert(store.is_writing("first"));
        store.async_persist(make_record("second", 1500, t + 2),
                make_memory_source(make_bytes(1500)), [&](const error_code& error) {
                    second_error = error;
                    ++num_done;
                });
        const bool finished = run_until(f.ios, [&] { return num_done == 2; });
        assert(finished);
        assert(!first_error);
        assert(second_error == seed_store_errc::quota_exceeded);
        assert(store.contains("first") && !store.contains("second"));
        assert(!store.is_writing("first"));
        assert(store.get_stats().used_bytes == 2000);
        assert(!fs::exists(store.data_path("second")));
        fs::remove_all(f.settings.seed_store_path);
    }

    // nothing is completed once the store is gone
    {
        fixture f;
        f.settings.seed_store_path = make_temp_dir("destroyed");
        f.settings.max_seed_storage = 3000;
        auto store = std::make_unique<seed_store>(f.ios, f.pool, f.settings);
        assert(!f.persist(*store, make_record("kept", 1000, t)));

        int num_called = 0;
        const auto handler = [&](const error_code&) { ++num_called; };
        // refused, already persisted, ineligible, and written
        store->async_persist(make_record("huge", 3001, t),
                make_memory_source(make_bytes(3001)), handler);
        store->async_persist(make_record("kept", 1000, t),
                make_memory_source(make_bytes(1000)), handler);
        store->async_persist(
                make_record("secret", 100, t, "chan", channel_privacy::restricted),
                make_memory_source(make_bytes(100)), handler);
        store->async_persist(make_record("late", 1000, t),
                make_memory_source(make_bytes(1000)), handler);
        store.reset();

        f.ios.restart();
        f.ios.run();
        assert(num_called == 0);
        fs::remove_all(f.settings.seed_store_path);
    }

    // records removed while being written are deleted once written
    {
        const auto dir = make_temp_dir("cancelled");
        {
            fixture f;
            f.settings.seed_store_path = dir;
            f.settings.max_seed_storage = 10000;
            seed_store store(f.ios, f.pool, f.settings);

            int num_done = 0;
            std::map<file_id_t, error_code> results;
            const auto persist = [&](const file_id_t& id) {
                store.async_persist(make_record(id, 1000, t),
                        make_memory_source(make_bytes(1000)),
                        [&, id](const error_code& error) {
                            results[id] = error;
                            ++num_done;
                        });
            };

            persist("removed");
            error_code error;
            store.remove("removed", error);
            assert(!error);
            assert(store.is_writing("removed") && store.is_cancelled("removed"));
            // it can only be removed once
            store.remove("removed", error);
            assert(error == seed_store_errc::record_not_found);

            persist("cleared1");
            persist("cleared2");
            assert(store.file_ids().size() == 2);
            store.clear(error);
            assert(!error);
            assert(store.file_ids().empty());

            // persisting it again while still being written revives the write
            persist("revived");
            store.remove("revived", error);
            assert(!error);
            persist("revived");
            assert(!store.is_cancelled("revived"));

            const bool finished = run_until(f.ios, [&] { return num_done == 5; });
            assert(finished);
            assert(results["removed"] == seed_store_errc::write_cancelled);
            assert(results["cleared1"] == seed_store_errc::write_cancelled);
            assert(results["cleared2"] == seed_store_errc::write_cancelled);
            assert(!results["revived"]);

            for(const auto& id : {"removed", "cleared1", "cleared2"}) {
                assert(!store.contains(id));
                assert(!store.is_writing(id) && !store.is_cancelled(id));
                assert(!fs::exists(store.header_path(id)));
                assert(!fs::exists(store.data_path(id)));
            }
            assert(store.contains("revived"));
            assert(store.get_stats().num_records == 1);
            assert(store.get_stats().used_bytes == 1000);
            f.pool.join();
        }

        // and don't come back on restart
        fixture f;
        f.settings.seed_store_path = dir;
        f.settings.max_seed_storage = 10000;
        seed_store store(f.ios, f.pool, f.settings);
        int num_expired = 0;
        error_code error;
        const auto loaded = store.load(system_clock::now(), num_expired, error);
        assert(!error);
        assert(loaded.size() == 1);
        assert(loaded[0].record.metadata.file_id == "revived");
        fs::remove_all(dir);
    }

    // reloading, expiration and cleanup on startup
    {
        const auto dir = make_temp_dir("reload");
        {
            fixture f;
            f.settings.seed_store_path = dir;
            f.settings.max_seed_storage = 100000;
            seed_store store(f.ios, f.pool, f.settings);
            assert(!f.persist(store, make_record("fresh", 3000, t), 7));
            const auto old_timestamp = t - int64_t(8) * 24 * 3600 * 1000;
            assert(!f.persist(store, make_record("stale", 2000, old_timestamp)));
            assert(!f.persist(store, make_record("cut", 2000, t)));
            f.pool.join();
        }

        // damage done while not running
        write_garbage(dir / "garbage.seed", "not a record");
        write_garbage(dir / "orphan.data", "contents without a header");
        write_garbage(dir / "partial.data.tmp", "an interrupted write");
        fs::resize_file(dir / "cut.data", 100);

        fixture f;
        f.settings.seed_store_path = dir;
        f.settings.max_seed_storage = 100000;
        seed_store store(f.ios, f.pool, f.settings);
        int num_expired = 0;
        error_code error;
        const auto loaded = store.load(system_clock::now(), num_expired, error);
        assert(!error);
        assert(num_expired == 1);
        assert(loaded.size() == 1);
        assert(loaded[0].record.metadata.file_id == "fresh");
        assert(loaded[0].record.timestamp == t);
        assert(equal_bytes(*loaded[0].source, make_bytes(3000, 7)));

        assert(store.contains("fresh"));
        assert(!store.contains("stale") && !store.contains("cut"));
        assert(store.get_stats().used_bytes == 3000);
        assert(!fs::exists(dir / "stale.seed") && !fs::exists(dir / "stale.data"));
        assert(!fs::exists(dir / "cut.data"));
        assert(!fs::exists(dir / "garbage.seed"));
        assert(!fs::exists(dir / "orphan.data"));
        assert(!fs::exists(dir / "partial.data.tmp"));

        // a record is purged once it's older than the expiry, relative to `now`
        seed_store later(f.ios, f.pool, f.settings);
        const auto in_eight_days = system_clock::now() + hours(24 * 8);
        assert(later.load(in_eight_days, num_expired, error).empty());
        assert(num_expired == 1);
        assert(!fs::exists(dir / "fresh.data"));
        fs::remove_all(dir);
    }
}
