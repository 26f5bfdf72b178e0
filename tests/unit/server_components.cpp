#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <future>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "chunkvault/content_range.hpp"
#include "chunkvault/crypto.hpp"
#include "chunkvault/error_codes.hpp"
#include "chunkvault/server/config.hpp"
#include "chunkvault/server/idle_reaper.hpp"
#include "chunkvault/server/local_blob_store.hpp"
#include "chunkvault/server/remote_blob_store.hpp"
#include "chunkvault/server/routing_blob_store.hpp"
#include "chunkvault/server/session_registry.hpp"
#include "chunkvault/server/streaming_sink.hpp"
#include "chunkvault/server/upload_engine.hpp"

using namespace chunkvault;
using namespace chunkvault::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    template <typename Fn>
    UploadError expect_upload_error(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const UploadError &ex)
        {
            return ex;
        }
        assert(false && "expected UploadError");
        return UploadError(ErrorCode::Ok, "unreachable");
    }

    std::string pattern(std::size_t size, char seed = 'a')
    {
        std::string data(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<char>(seed + static_cast<char>(i % 26));
        }
        return data;
    }

    std::string digest_of(std::string_view text)
    {
        crypto::StreamHasher hasher;
        hasher.update(std::as_bytes(std::span(text.data(), text.size())));
        return hasher.finish();
    }

    std::span<const std::byte> bytes_of(const std::string &text)
    {
        return std::as_bytes(std::span(text.data(), text.size()));
    }

    std::string read_all(ByteStream &stream)
    {
        std::string out;
        std::vector<std::byte> buffer(7);
        while (const auto count = stream.read(buffer))
        {
            out.append(reinterpret_cast<const char *>(buffer.data()), count);
        }
        return out;
    }

    // Request body stand-in: serves data, optionally in small pieces, then ends or throws early.
    class MemoryStream : public ByteStream
    {
    public:
        explicit MemoryStream(std::string data, std::size_t piece = 0, bool throw_at_end = false)
            : data_(std::move(data)), piece_(piece), throw_at_end_(throw_at_end)
        {
        }

        std::size_t read(std::span<std::byte> buffer) override
        {
            if (position_ == data_.size())
            {
                if (throw_at_end_)
                {
                    throw std::runtime_error("connection reset");
                }
                return 0;
            }
            auto count = std::min(buffer.size(), data_.size() - position_);
            if (piece_ > 0)
            {
                count = std::min(count, piece_);
            }
            std::memcpy(buffer.data(), data_.data() + position_, count);
            position_ += count;
            return count;
        }

    private:
        std::string data_;
        std::size_t piece_;
        bool throw_at_end_;
        std::size_t position_{};
    };

    struct FakeSinkState
    {
        std::mutex mutex;
        std::string data;
        int finalize_calls{};
        int abort_calls{};
    };

    struct FakeBehaviour
    {
        std::chrono::milliseconds write_delay{0};
        bool fail_write{false};
        bool fail_finalize{false};
        // Writes fail once the stored data would grow past this many bytes.
        std::optional<std::size_t> fail_after_bytes;
    };

    class FakeBlobStore;

    class FakeBlobSink : public BlobSink
    {
    public:
        FakeBlobSink(FakeBlobStore &store, std::shared_ptr<FakeSinkState> state, FakeBehaviour behaviour)
            : store_(store), state_(std::move(state)), behaviour_(behaviour)
        {
        }

        void write(std::span<const std::byte> data) override
        {
            if (behaviour_.write_delay.count() > 0)
            {
                std::this_thread::sleep_for(behaviour_.write_delay);
            }
            std::lock_guard lock(state_->mutex);
            if (behaviour_.fail_write ||
                (behaviour_.fail_after_bytes && state_->data.size() + data.size() > *behaviour_.fail_after_bytes))
            {
                throw std::runtime_error("disk full");
            }
            state_->data.append(reinterpret_cast<const char *>(data.data()), data.size());
        }

        ObjectHandle finalize() override;

        void abort() noexcept override
        {
            std::lock_guard lock(state_->mutex);
            ++state_->abort_calls;
        }

    private:
        FakeBlobStore &store_;
        std::shared_ptr<FakeSinkState> state_;
        FakeBehaviour behaviour_;
    };

    class FakeBlobStore : public BlobStore
    {
    public:
        explicit FakeBlobStore(std::string name = "local") : name_(std::move(name)) {}

        std::string_view provider() const noexcept override { return name_; }

        std::unique_ptr<BlobSink> open_sink(const ObjectMetadata &metadata) override
        {
            std::lock_guard lock(mutex_);
            opened.push_back(metadata);
            sinks.push_back(std::make_shared<FakeSinkState>());
            return std::make_unique<FakeBlobSink>(*this, sinks.back(), behaviour);
        }

        std::unique_ptr<ByteStream> open_read_stream(const ObjectHandle &handle) override
        {
            std::lock_guard lock(mutex_);
            auto it = objects.find(handle.id);
            if (it == objects.end())
            {
                throw UploadError(ErrorCode::NotFound, "Object not found");
            }
            return std::make_unique<MemoryStream>(it->second);
        }

        void remove(const ObjectHandle &handle) override
        {
            std::lock_guard lock(mutex_);
            if (objects.erase(handle.id) == 0)
            {
                throw UploadError(ErrorCode::NotFound, "Object not found");
            }
        }

        ObjectHandle store(const std::string &data)
        {
            std::lock_guard lock(mutex_);
            const auto id = "obj-" + std::to_string(objects.size() + 1);
            objects[id] = data;
            return {.provider = name_, .id = id, .size = data.size()};
        }

        FakeSinkState &last_sink()
        {
            std::lock_guard lock(mutex_);
            return *sinks.back();
        }

        FakeBehaviour behaviour;
        std::vector<ObjectMetadata> opened;
        std::vector<std::shared_ptr<FakeSinkState>> sinks;
        std::map<std::string, std::string> objects;

    private:
        std::string name_;
        std::mutex mutex_;
    };

    ObjectHandle FakeBlobSink::finalize()
    {
        std::string data;
        {
            std::lock_guard lock(state_->mutex);
            ++state_->finalize_calls;
            data = state_->data;
        }
        if (behaviour_.fail_finalize)
        {
            throw std::runtime_error("commit rejected");
        }
        return store_.store(data);
    }

    class ManualClock
    {
    public:
        SessionRegistry::ClockFunction function()
        {
            return [this]
            { return now_.load(); };
        }

        void advance(std::chrono::seconds by) { now_ = now_.load() + by; }

    private:
        std::atomic<Clock::time_point> now_{Clock::time_point{} + std::chrono::hours{1}};
    };

    UploadEngineOptions small_options()
    {
        return {
            .sink = {.high_water_mark = 256, .write_size = 64},
            .idle_timeout = std::chrono::seconds{60},
            .max_upload_size = 1024 * 1024,
        };
    }

    // Sends data[start, end) as one chunk.
    protocol::ChunkResult put(UploadEngine &engine, const std::string &session, const std::string &owner,
                              const std::string &data, std::uint64_t start, std::uint64_t end)
    {
        MemoryStream body(data.substr(start, end - start), 13);
        const auto header = protocol::format_content_range({start, end - 1, data.size()});
        return engine.append_chunk(session, owner, header, body, end - start);
    }

    void test_streaming_sink_backpressure()
    {
        FakeBlobStore store;
        store.behaviour.write_delay = std::chrono::milliseconds{1};
        StreamingSink sink(store.open_sink({}), {.high_water_mark = 256, .write_size = 64});

        const auto data = pattern(64 * 40);
        bool saw_backpressure = false;
        for (std::size_t offset = 0; offset < data.size(); offset += 64)
        {
            if (!sink.write(bytes_of(data).subspan(offset, 64)))
            {
                saw_backpressure = true;
                sink.await_drain();
            }
            assert(sink.buffered_bytes() <= sink.high_water_mark());
        }
        const auto handle = sink.end();

        assert(saw_backpressure);
        assert(sink.peak_buffered_bytes() <= 256);
        assert(sink.bytes_forwarded() == data.size());
        assert(sink.state() == StreamingSink::State::Finished);
        assert(store.objects.at(handle.id) == data);
        assert(store.last_sink().finalize_calls == 1);
        assert(store.last_sink().abort_calls == 0);

        bool rejected = false;
        try
        {
            sink.write(bytes_of(pattern(65)));
        }
        catch (const std::invalid_argument &)
        {
            rejected = true;
        }
        assert(rejected);
        assert(expect_upload_error([&]
                                   { sink.write(bytes_of(pattern(8))); })
                   .code() == ErrorCode::SinkClosed);
    }

    void test_streaming_sink_abort_and_failure()
    {
        FakeBlobStore store;
        {
            StreamingSink sink(store.open_sink({}), {.high_water_mark = 256, .write_size = 64});
            sink.write(bytes_of(pattern(32)));
            sink.abort("client went away");
            sink.abort("again");
            assert(sink.state() == StreamingSink::State::Aborted);
            assert(expect_upload_error([&]
                                       { sink.write(bytes_of(pattern(8))); })
                       .code() == ErrorCode::SinkClosed);
            assert(expect_upload_error([&]
                                       { sink.end(); })
                       .code() == ErrorCode::SinkClosed);
        }
        assert(store.last_sink().abort_calls == 1);
        assert(store.last_sink().finalize_calls == 0);

        store.behaviour.fail_write = true;
        {
            StreamingSink sink(store.open_sink({}), {.high_water_mark = 256, .write_size = 64});
            sink.write(bytes_of(pattern(16)));
            const auto error = expect_upload_error([&]
                                                   { sink.end(); });
            assert(error.code() == ErrorCode::StorageFailure);
            assert(std::string(error.what()).find("disk full") != std::string::npos);
            assert(sink.state() == StreamingSink::State::Failed);
        }
        assert(store.last_sink().abort_calls == 1);
        assert(store.last_sink().finalize_calls == 0);

        // Writes after a store failure are refused; the store error stays with await_drain.
        {
            StreamingSink sink(store.open_sink({}), {.high_water_mark = 256, .write_size = 64});
            sink.write(bytes_of(pattern(16)));
            for (int i = 0; i < 500 && sink.state() != StreamingSink::State::Failed; ++i)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
            assert(sink.state() == StreamingSink::State::Failed);
            assert(sink.failure());
            assert(expect_upload_error([&]
                                       { sink.write(bytes_of(pattern(8))); })
                       .code() == ErrorCode::SinkClosed);
            const auto drained = expect_upload_error([&]
                                                     { sink.await_drain(); });
            assert(drained.code() == ErrorCode::StorageFailure);
            assert(std::string(drained.what()).find("disk full") != std::string::npos);
        }
        assert(store.last_sink().abort_calls == 1);

        store.behaviour.fail_write = false;
        store.behaviour.fail_finalize = true;
        {
            StreamingSink sink(store.open_sink({}), {.high_water_mark = 256, .write_size = 64});
            sink.write(bytes_of(pattern(16)));
            assert(expect_upload_error([&]
                                       { sink.end(); })
                       .code() == ErrorCode::StorageFailure);
        }
        assert(store.last_sink().finalize_calls == 1);
        assert(store.last_sink().abort_calls == 1);

        // Destroying an open sink aborts it.
        store.behaviour.fail_finalize = false;
        {
            StreamingSink sink(store.open_sink({}));
        }
        assert(store.last_sink().abort_calls == 1);
    }

    void test_registry_lifecycle()
    {
        FakeBlobStore store;
        ManualClock clock;
        SessionRegistry registry(clock.function());

        auto first = registry.create("alice", 10, std::make_unique<StreamingSink>(store.open_sink({})), {});
        auto second = registry.create("bob", 20, std::make_unique<StreamingSink>(store.open_sink({})), {});
        assert(first->session_id.size() == 32);
        assert(first->session_id != second->session_id);
        assert(registry.size() == 2);
        assert(registry.get(first->session_id) == first);
        assert(!registry.find("missing"));
        assert(expect_upload_error([&]
                                   { registry.get("missing"); })
                   .code() == ErrorCode::NotFound);

        const auto snapshot = registry.snapshot();
        assert(snapshot.size() == 2);

        clock.advance(std::chrono::seconds{30});
        second->last_activity = registry.now();
        clock.advance(std::chrono::seconds{40});
        assert(registry.reap_idle(std::chrono::seconds{60}) == 1);
        assert(!registry.find(first->session_id));
        assert(first->status == protocol::UploadStatus::Failed);
        assert(store.sinks[0]->abort_calls == 1);
        assert(registry.find(second->session_id));

        // A session busy with a chunk is not reaped.
        clock.advance(std::chrono::seconds{120});
        std::promise<void> locked;
        std::promise<void> release;
        auto release_future = release.get_future();
        std::thread holder([&]
                           {
            std::lock_guard lock(second->mutex);
            locked.set_value();
            release_future.wait(); });
        locked.get_future().wait();
        assert(registry.reap_idle(std::chrono::seconds{60}) == 0);
        release.set_value();
        holder.join();
        assert(registry.reap_idle(std::chrono::seconds{60}) == 1);

        registry.create("carol", 5, std::make_unique<StreamingSink>(store.open_sink({})), {});
        assert(registry.abort_all("shutdown") == 1);
        assert(registry.size() == 0);
        assert(store.sinks[2]->abort_calls == 1);
    }

    void test_engine_happy_path()
    {
        FakeBlobStore store;
        ManualClock clock;
        UploadEngine engine(store, small_options(), clock.function());

        const auto data = pattern(1000);
        const auto session = engine.init_upload("alice", data.size(), {.filename = "report.pdf"});
        assert(store.opened.back().owner_id == "alice");
        assert(store.opened.back().total_size == 1000);

        auto progress = engine.query_upload(session, "alice");
        assert(progress.status == protocol::UploadStatus::Pending);
        assert(progress.received_size == 0);

        const auto partial = put(engine, session, "alice", data, 0, 400);
        assert(!partial.complete);
        assert(partial.received_size == 400);
        progress = engine.query_upload(session, "alice");
        assert(progress.status == protocol::UploadStatus::Uploading);
        assert(progress.received_size == 400);

        const auto done = put(engine, session, "alice", data, 400, 1000);
        assert(done.complete);
        assert(done.received_size == 1000);
        assert(done.object && done.object->provider == "local");
        assert(done.object->size == 1000);
        assert(store.objects.at(done.object->id) == data);
        assert(store.last_sink().finalize_calls == 1);
        assert(store.last_sink().abort_calls == 0);
        assert(engine.registry().size() == 0);

        assert(expect_upload_error([&]
                                   { engine.query_upload(session, "alice"); })
                   .code() == ErrorCode::NotFound);
        assert(expect_upload_error([&]
                                   { put(engine, session, "alice", data, 0, 10); })
                   .code() == ErrorCode::NotFound);

        auto stream = engine.open_download(*done.object);
        assert(read_all(*stream) == data);
        engine.delete_object(*done.object);
        assert(expect_upload_error([&]
                                   { engine.delete_object(*done.object); })
                   .code() == ErrorCode::NotFound);
        assert(expect_upload_error([&]
                                   { engine.open_download(*done.object); })
                   .code() == ErrorCode::NotFound);
    }

    void test_engine_rejects_bad_chunks()
    {
        FakeBlobStore store;
        UploadEngine engine(store, small_options());

        assert(expect_upload_error([&]
                                   { engine.init_upload("alice", 0, {}); })
                   .code() == ErrorCode::InvalidSize);
        assert(expect_upload_error([&]
                                   { engine.init_upload("alice", 2 * 1024 * 1024, {}); })
                   .code() == ErrorCode::InvalidSize);

        const auto data = pattern(100);
        const auto session = engine.init_upload("alice", data.size(), {});
        put(engine, session, "alice", data, 0, 50);

        // Gap ahead of the received prefix.
        auto error = expect_upload_error([&]
                                         { put(engine, session, "alice", data, 60, 100); });
        assert(error.code() == ErrorCode::OutOfOrderChunk);
        assert(error.received_size() == 50u);

        // Replay of an accepted chunk.
        error = expect_upload_error([&]
                                    { put(engine, session, "alice", data, 0, 50); });
        assert(error.code() == ErrorCode::OutOfOrderChunk);
        assert(error.received_size() == 50u);

        MemoryStream body(data.substr(50, 10));
        assert(expect_upload_error([&]
                                   { engine.append_chunk(session, "alice", "bytes 50-59/200", body, 10); })
                   .code() == ErrorCode::TotalMismatch);
        assert(expect_upload_error([&]
                                   { engine.append_chunk(session, "alice", "bytes 50-100/100", body, 51); })
                   .code() == ErrorCode::RangeExceedsTotal);
        assert(expect_upload_error([&]
                                   { engine.append_chunk(session, "alice", "bytes=50-59", body, 10); })
                   .code() == ErrorCode::MalformedRange);
        assert(expect_upload_error([&]
                                   { engine.append_chunk(session, "alice", "bytes 50-59/100", body, std::nullopt); })
                   .code() == ErrorCode::InvalidContentLength);
        assert(expect_upload_error([&]
                                   { engine.append_chunk(session, "alice", "bytes 50-59/100", body, 0); })
                   .code() == ErrorCode::InvalidContentLength);
        assert(expect_upload_error([&]
                                   { engine.append_chunk(session, "alice", "bytes 50-59/100", body, 9); })
                   .code() == ErrorCode::InvalidContentLength);

        assert(expect_upload_error([&]
                                   { put(engine, session, "mallory", data, 50, 100); })
                   .code() == ErrorCode::Forbidden);
        assert(expect_upload_error([&]
                                   { engine.query_upload(session, "mallory"); })
                   .code() == ErrorCode::Forbidden);
        assert(expect_upload_error([&]
                                   { engine.query_upload("no-such-session", "alice"); })
                   .code() == ErrorCode::NotFound);

        // None of the rejections moved the session.
        assert(engine.query_upload(session, "alice").received_size == 50);
        assert(put(engine, session, "alice", data, 50, 100).complete);
        assert(store.objects.begin()->second == data);
    }

    void test_engine_short_and_broken_bodies()
    {
        FakeBlobStore store;
        ManualClock clock;
        UploadEngine engine(store, small_options(), clock.function());

        const auto data = pattern(200);
        const auto session = engine.init_upload("alice", data.size(), {});

        // Content-Length promised 100 bytes but the body stopped after 30.
        MemoryStream short_body(data.substr(0, 30));
        auto error = expect_upload_error([&]
                                         { engine.append_chunk(session, "alice", "bytes 0-99/200", short_body, 100); });
        assert(error.code() == ErrorCode::IncompleteChunk);
        assert(error.received_size() == 30u);
        assert(engine.query_upload(session, "alice").received_size == 30);

        // The connection dies after 20 more bytes.
        MemoryStream broken_body(data.substr(30, 20), 0, true);
        error = expect_upload_error([&]
                                    { engine.append_chunk(session, "alice", "bytes 30-129/200", broken_body, 100); });
        assert(error.code() == ErrorCode::IncompleteChunk);
        assert(error.received_size() == 50u);

        const auto done = put(engine, session, "alice", data, 50, 200);
        assert(done.complete);
        assert(store.objects.at(done.object->id) == data);
    }

    void test_engine_storage_failures()
    {
        FakeBlobStore store;
        UploadEngine engine(store, small_options());
        const auto data = pattern(100);

        store.behaviour.fail_write = true;
        auto session = engine.init_upload("alice", data.size(), {});
        auto error = expect_upload_error([&]
                                         { put(engine, session, "alice", data, 0, 100); });
        assert(error.code() == ErrorCode::StorageFailure);
        assert(store.last_sink().abort_calls == 1);
        assert(store.last_sink().finalize_calls == 0);
        assert(expect_upload_error([&]
                                   { engine.query_upload(session, "alice"); })
                   .code() == ErrorCode::NotFound);

        // The last 9-byte piece of the first chunk fails behind the engine's back;
        // the next chunk reports the store error.
        store.behaviour.fail_write = false;
        store.behaviour.fail_after_bytes = 91;
        const auto larger = pattern(200);
        session = engine.init_upload("alice", larger.size(), {});
        const auto first = put(engine, session, "alice", larger, 0, 100);
        assert(!first.complete && first.received_size == 100);
        const auto live = engine.registry().get(session);
        for (int i = 0; i < 500 && live->sink->state() != StreamingSink::State::Failed; ++i)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        assert(live->sink->state() == StreamingSink::State::Failed);
        error = expect_upload_error([&]
                                    { put(engine, session, "alice", larger, 100, 200); });
        assert(error.code() == ErrorCode::StorageFailure);
        assert(std::string(error.what()).find("disk full") != std::string::npos);
        assert(engine.registry().size() == 0);
        assert(store.last_sink().abort_calls == 1);
        store.behaviour.fail_after_bytes.reset();

        store.behaviour.fail_write = false;
        store.behaviour.fail_finalize = true;
        session = engine.init_upload("alice", data.size(), {});
        error = expect_upload_error([&]
                                    { put(engine, session, "alice", data, 0, 100); });
        assert(error.code() == ErrorCode::StorageFailure);
        assert(store.last_sink().finalize_calls == 1);
        assert(store.last_sink().abort_calls == 1);
        assert(engine.registry().size() == 0);
        assert(store.objects.empty());
    }

    void test_engine_cancel_reap_and_shutdown()
    {
        FakeBlobStore store;
        ManualClock clock;
        UploadEngine engine(store, small_options(), clock.function());
        const auto data = pattern(100);

        const auto cancelled = engine.init_upload("alice", data.size(), {});
        put(engine, cancelled, "alice", data, 0, 40);
        assert(expect_upload_error([&]
                                   { engine.cancel_upload(cancelled, "bob"); })
                   .code() == ErrorCode::Forbidden);
        engine.cancel_upload(cancelled, "alice");
        assert(store.last_sink().abort_calls == 1);
        assert(expect_upload_error([&]
                                   { engine.query_upload(cancelled, "alice"); })
                   .code() == ErrorCode::NotFound);
        engine.cancel_upload(cancelled, "alice");
        engine.cancel_upload("never-existed", "alice");
        assert(store.last_sink().abort_calls == 1);

        const auto idle = engine.init_upload("alice", data.size(), {});
        const auto active = engine.init_upload("alice", data.size(), {});
        clock.advance(std::chrono::seconds{50});
        put(engine, active, "alice", data, 0, 10);
        clock.advance(std::chrono::seconds{20});
        assert(engine.reap_idle() == 1);
        assert(expect_upload_error([&]
                                   { put(engine, idle, "alice", data, 0, 10); })
                   .code() == ErrorCode::NotFound);
        assert(engine.query_upload(active, "alice").received_size == 10);

        engine.init_upload("bob", data.size(), {});
        assert(engine.shutdown("stopping") == 2);
        assert(engine.registry().size() == 0);
        for (const auto &sink : store.sinks)
        {
            assert(sink->finalize_calls == 0);
            assert(sink->abort_calls == 1);
        }
    }

    void test_engine_concurrent_same_offset()
    {
        FakeBlobStore store;
        store.behaviour.write_delay = std::chrono::milliseconds{1};
        UploadEngine engine(store, small_options());
        const auto data = pattern(1000);
        const auto session = engine.init_upload("alice", data.size(), {});

        std::atomic<int> accepted{0};
        std::atomic<int> out_of_order{0};
        auto attempt = [&]
        {
            try
            {
                put(engine, session, "alice", data, 0, 500);
                ++accepted;
            }
            catch (const UploadError &ex)
            {
                if (ex.code() == ErrorCode::OutOfOrderChunk && ex.received_size() == 500u)
                {
                    ++out_of_order;
                }
            }
        };
        std::thread first(attempt);
        std::thread second(attempt);
        first.join();
        second.join();

        assert(accepted == 1);
        assert(out_of_order == 1);
        assert(engine.query_upload(session, "alice").received_size == 500);
        assert(put(engine, session, "alice", data, 500, 1000).complete);
        assert(store.objects.begin()->second == data);
    }

    void test_idle_reaper_timer()
    {
        FakeBlobStore store;
        ManualClock clock;
        auto options = small_options();
        options.idle_timeout = std::chrono::seconds{5};
        UploadEngine engine(store, options, clock.function());
        engine.init_upload("alice", 10, {});
        clock.advance(std::chrono::seconds{10});

        asio::io_context io_context;
        IdleReaper reaper(io_context, engine, std::chrono::seconds{1});
        reaper.start();
        io_context.run_for(std::chrono::milliseconds{1500});
        reaper.stop();
        assert(engine.registry().size() == 0);
    }

    void test_local_blob_store()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_local_store_test";
        cleanup_path(root);
        LocalBlobStore store(root);
        assert(std::filesystem::is_directory(store.staging_dir()));
        assert(std::filesystem::is_directory(store.objects_dir()));

        const auto data = pattern(5000);
        auto sink = store.open_sink({.filename = "a.bin"});
        sink->write(bytes_of(data).first(3000));
        sink->write(bytes_of(data).subspan(3000));
        const auto handle = sink->finalize();
        assert(handle.provider == "local");
        assert(handle.id == digest_of(data));
        assert(handle.size == data.size());
        assert(std::filesystem::is_regular_file(store.object_path(handle.id)));
        assert(store.object_path(handle.id).parent_path().filename() == handle.id.substr(0, 2));
        assert(std::filesystem::is_empty(store.staging_dir()));

        // Same content again lands on the same object.
        auto duplicate = store.open_sink({.filename = "b.bin"});
        duplicate->write(bytes_of(data));
        assert(duplicate->finalize().id == handle.id);
        assert(std::filesystem::is_empty(store.staging_dir()));

        auto stream = store.open_read_stream(handle);
        assert(read_all(*stream) == data);

        auto aborted = store.open_sink({});
        aborted->write(bytes_of(data).first(10));
        assert(!std::filesystem::is_empty(store.staging_dir()));
        aborted->abort();
        assert(std::filesystem::is_empty(store.staging_dir()));

        assert(expect_upload_error([&]
                                   { store.open_read_stream({.provider = "local", .id = "../../etc/passwd"}); })
                   .code() == ErrorCode::NotFound);
        assert(expect_upload_error([&]
                                   { store.open_read_stream({.provider = "remote", .id = handle.id}); })
                   .code() == ErrorCode::NotFound);

        store.remove(handle);
        assert(!std::filesystem::exists(store.object_path(handle.id)));
        assert(expect_upload_error([&]
                                   { store.remove(handle); })
                   .code() == ErrorCode::NotFound);

        {
            std::ofstream stale(store.staging_dir() / "leftover.part", std::ios::binary);
            stale << "partial";
        }
        assert(store.cleanup_staging(std::chrono::seconds{3600}) == 0);
        assert(store.cleanup_staging(std::chrono::seconds{0}) == 1);
        assert(std::filesystem::is_empty(store.staging_dir()));

        cleanup_path(root);
    }

    void test_routing_blob_store()
    {
        FakeBlobStore local("local");
        FakeBlobStore remote("remote");
        RoutingBlobStore routing(local, &remote, 100);

        assert(&routing.select({.total_size = 100}) == &local);
        assert(&routing.select({.total_size = 101}) == &remote);
        assert(&routing.select({.total_size = 500, .provider = std::string("local")}) == &local);
        assert(&routing.select({.total_size = 5, .provider = std::string("remote")}) == &remote);
        assert(expect_upload_error([&]
                                   { routing.select({.total_size = 5, .provider = std::string("s3")}); })
                   .code() == ErrorCode::Unsupported);

        routing.open_sink({.total_size = 500});
        assert(remote.opened.size() == 1);
        assert(local.opened.empty());

        const auto handle = remote.store("remote bytes");
        auto stream = routing.open_read_stream(handle);
        assert(read_all(*stream) == "remote bytes");
        routing.remove(handle);
        assert(remote.objects.empty());
        assert(expect_upload_error([&]
                                   { routing.remove({.provider = "ftp", .id = "x"}); })
                   .code() == ErrorCode::Unsupported);

        RoutingBlobStore local_only(local, nullptr, 100);
        assert(&local_only.select({.total_size = 5000}) == &local);
        assert(expect_upload_error([&]
                                   { local_only.select({.provider = std::string("remote")}); })
                   .code() == ErrorCode::Unsupported);
    }

    // Scripted stand-in for a Drive-style resumable upload API.
    class FakeRemoteService : public HttpTransport
    {
    public:
        HttpResponse perform(const HttpRequest &request) override
        {
            std::lock_guard lock(mutex_);
            requests.push_back(request);
            if (fail_next > 0)
            {
                --fail_next;
                return {.status = 503};
            }
            if (drop_next > 0)
            {
                --drop_next;
                throw TransportError("connection refused");
            }

            if (request.url == "https://auth.test/token")
            {
                ++token_requests;
                return {.status = 200,
                        .body = R"({"access_token":"t)" + std::to_string(token_requests) + R"(","expires_in":3600})"};
            }
            const auto authorization = request.headers.get("Authorization").value_or("");
            if (authorization == "Bearer " + rejected_token)
            {
                return {.status = 401};
            }
            if (request.method == "POST" && request.url == "https://upload.test/files?uploadType=resumable")
            {
                HttpResponse response{.status = 200};
                response.headers.set("Location", "https://upload.test/session/1");
                return response;
            }
            if (request.url == "https://upload.test/session/1")
            {
                return handle_session(request);
            }
            if (request.url == "https://files.test/files/file123?alt=media")
            {
                return handle_download(request);
            }
            if (request.method == "DELETE" && request.url == "https://files.test/files/file123")
            {
                if (stored.empty())
                {
                    return {.status = 404};
                }
                stored.clear();
                return {.status = 204};
            }
            return {.status = 404};
        }

        std::vector<HttpRequest> requests;
        std::string stored;
        std::string rejected_token;
        int fail_next{};
        int drop_next{};
        int token_requests{};
        bool partial_commit_once{false};
        bool session_deleted{false};

    private:
        HttpResponse handle_session(const HttpRequest &request)
        {
            if (request.method == "DELETE")
            {
                session_deleted = true;
                return {.status = 499};
            }
            const auto range = request.headers.get("Content-Range").value_or("");
            const auto slash = range.find('/');
            const bool last = range.substr(slash + 1) != "*";
            std::string body = request.body;
            if (partial_commit_once && !body.empty())
            {
                partial_commit_once = false;
                body.resize(body.size() / 2);
            }
            if (range.find("bytes " + std::to_string(stored.size()) + "-") == 0 || body.empty())
            {
                stored += body;
            }
            if (last && stored.size() == std::stoull(range.substr(slash + 1)))
            {
                return {.status = 200, .body = R"({"id":"file123","name":"movie.mkv"})"};
            }
            HttpResponse response{.status = 308};
            if (const auto value = protocol::format_resume_range(stored.size()))
            {
                response.headers.set("Range", *value);
            }
            return response;
        }

        HttpResponse handle_download(const HttpRequest &request)
        {
            const auto range = request.headers.get("Range").value_or("");
            const auto dash = range.find('-');
            const auto first = std::stoull(range.substr(6, dash - 6));
            const auto last = std::stoull(range.substr(dash + 1));
            if (stored.empty())
            {
                return {.status = 404};
            }
            if (first >= stored.size())
            {
                return {.status = 416};
            }
            return {.status = 206, .body = stored.substr(first, last - first + 1)};
        }

        std::mutex mutex_;
    };

    RemoteStoreConfig test_remote_config()
    {
        RemoteStoreConfig config;
        config.upload_url = "https://upload.test/files";
        config.files_url = "https://files.test/files";
        config.token_url = "https://auth.test/token";
        config.credentials.access_token = "static";
        config.retry = {.max_retries = 2, .initial_delay = std::chrono::milliseconds{0}};
        config.granularity = 4;
        config.upload_chunk_size = 8;
        return config;
    }

    void test_remote_blob_store_upload_and_download()
    {
        FakeRemoteService service;
        RemoteBlobStore store(test_remote_config(), service);

        service.fail_next = 1;
        auto sink = store.open_sink({.filename = "movie.mkv", .content_type = "video/x-matroska", .total_size = 21,
                                     .owner_id = "alice"});
        const auto init = service.requests[1];
        assert(init.method == "POST");
        assert(init.headers.get("Authorization") == std::optional<std::string>("Bearer static"));
        assert(init.headers.get("X-Upload-Content-Length") == std::optional<std::string>("21"));
        const auto metadata = nlohmann::json::parse(init.body);
        assert(metadata.at("name") == "movie.mkv");
        assert(metadata.at("appProperties").at("ownerId") == "alice");

        const auto data = pattern(21);
        service.partial_commit_once = true;
        for (std::size_t offset = 0; offset < data.size(); offset += 5)
        {
            sink->write(bytes_of(data).subspan(offset, std::min<std::size_t>(5, data.size() - offset)));
        }
        const auto handle = sink->finalize();
        assert(handle.provider == "remote");
        assert(handle.id == "file123");
        assert(handle.size == 21);
        assert(service.stored == data);

        bool saw_open_range = false;
        bool saw_final_range = false;
        for (const auto &request : service.requests)
        {
            const auto range = request.headers.get("Content-Range");
            if (!range)
            {
                continue;
            }
            saw_open_range = saw_open_range || range->ends_with("/*");
            saw_final_range = saw_final_range || range->ends_with("/21");
            if (range->ends_with("/*"))
            {
                assert(request.body.size() % 4 == 0);
            }
        }
        assert(saw_open_range && saw_final_range);

        auto stream = store.open_read_stream(handle);
        assert(read_all(*stream) == data);

        store.remove(handle);
        assert(service.stored.empty());
        assert(expect_upload_error([&]
                                   { store.remove(handle); })
                   .code() == ErrorCode::NotFound);
        assert(expect_upload_error([&]
                                   { store.open_read_stream(handle); })
                   .code() == ErrorCode::NotFound);
        assert(expect_upload_error([&]
                                   { store.remove({.provider = "remote", .id = "../x"}); })
                   .code() == ErrorCode::NotFound);
    }

    void test_remote_blob_store_failures()
    {
        FakeRemoteService service;
        RemoteBlobStore store(test_remote_config(), service);

        auto sink = store.open_sink({.filename = "x", .total_size = 8});
        sink->write(bytes_of(pattern(4)));
        sink->abort();
        assert(service.session_deleted);

        service.drop_next = 3;
        assert(expect_upload_error([&]
                                   { store.open_sink({.total_size = 8}); })
                   .code() == ErrorCode::StorageFailure);

        service.fail_next = 3;
        assert(expect_upload_error([&]
                                   { store.open_sink({.total_size = 8}); })
                   .code() == ErrorCode::StorageFailure);

        auto short_sink = store.open_sink({.total_size = 8});
        short_sink->write(bytes_of(pattern(3)));
        assert(expect_upload_error([&]
                                   { short_sink->finalize(); })
                   .code() == ErrorCode::StorageFailure);

        bool rejected = false;
        auto config = test_remote_config();
        config.upload_chunk_size = 6;
        try
        {
            RemoteBlobStore misconfigured(config, service);
        }
        catch (const std::invalid_argument &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    void test_remote_token_refresh()
    {
        FakeRemoteService service;
        auto now = std::chrono::system_clock::time_point{} + std::chrono::hours{1000};
        RemoteCredentials credentials{.client_id = "id", .client_secret = "secret", .refresh_token = "refresh"};

        AccessTokenProvider tokens(service, "https://auth.test/token", credentials, {.max_retries = 0},
                                   [&]
                                   { return now; });
        assert(tokens.can_refresh());
        assert(tokens.token() == "t1");
        assert(tokens.token() == "t1");
        assert(service.token_requests == 1);
        const auto &exchange = service.requests.front();
        assert(exchange.method == "POST");
        assert(exchange.body.find("grant_type=refresh_token") != std::string::npos);
        assert(exchange.body.find("refresh_token=refresh") != std::string::npos);

        now += std::chrono::seconds{3600 - 30};
        assert(tokens.token() == "t2");
        tokens.invalidate();
        assert(tokens.token() == "t3");

        // A rejected bearer token is refreshed once and the request repeated.
        FakeRemoteService api;
        auto config = test_remote_config();
        config.credentials = credentials;
        RemoteBlobStore store(config, api);
        api.rejected_token = "t1";
        auto sink = store.open_sink({.total_size = 4});
        assert(api.token_requests == 2);
        assert(api.requests.back().headers.get("Authorization") == std::optional<std::string>("Bearer t2"));
        sink->abort();

        AccessTokenProvider empty(service, "https://auth.test/token", {}, {}, {});
        assert(!empty.can_refresh());
        assert(expect_upload_error([&]
                                   { empty.token(); })
                   .code() == ErrorCode::StorageFailure);
    }

    class Arguments
    {
    public:
        Arguments(std::initializer_list<std::string> values) : storage_(values)
        {
            for (auto &value : storage_)
            {
                pointers_.push_back(value.data());
            }
        }

        int argc() { return static_cast<int>(pointers_.size()); }
        char **argv() { return pointers_.data(); }

    private:
        std::vector<std::string> storage_;
        std::vector<char *> pointers_;
    };

    EnvironmentLookup environment(std::map<std::string, std::string> values)
    {
        return [values = std::move(values)](const std::string &name) -> std::optional<std::string>
        {
            auto it = values.find(name);
            if (it == values.end())
            {
                return std::nullopt;
            }
            return it->second;
        };
    }

    template <typename Fn>
    bool throws_config_error(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const ConfigError &)
        {
            return true;
        }
        return false;
    }

    void test_server_config()
    {
        const auto no_env = environment({});

        Arguments basic{"server", "--port", "9000", "--root", "/tmp/cv", "--idle-timeout", "120", "--log-level",
                        "debug"};
        auto config = parse_server_arguments(basic.argc(), basic.argv(), no_env);
        assert(config.port == 9000);
        assert(config.root == "/tmp/cv");
        assert(config.idle_timeout == std::chrono::seconds{120});
        assert(config.log_level == "debug");
        assert(config.high_water_mark == 256 * 1024);
        assert(config.remote_threshold == 50ULL * 1024 * 1024);
        assert(!config.remote);

        Arguments help{"server", "--help"};
        assert(parse_server_arguments(help.argc(), help.argv(), no_env).show_help);

        Arguments missing_root{"server", "--port", "9000"};
        assert(throws_config_error([&]
                                   { parse_server_arguments(missing_root.argc(), missing_root.argv(), no_env); }));
        Arguments bad_port{"server", "--port", "70000", "--root", "/tmp"};
        assert(throws_config_error([&]
                                   { parse_server_arguments(bad_port.argc(), bad_port.argv(), no_env); }));
        Arguments unknown{"server", "--port", "1", "--root", "/tmp", "--colour", "blue"};
        assert(throws_config_error([&]
                                   { parse_server_arguments(unknown.argc(), unknown.argv(), no_env); }));
        Arguments bad_marks{"server", "--port", "1", "--root", "/tmp", "--high-water-mark", "10"};
        assert(throws_config_error([&]
                                   { parse_server_arguments(bad_marks.argc(), bad_marks.argv(), no_env); }));
        Arguments bad_level{"server", "--port", "1", "--root", "/tmp", "--log-level", "loud"};
        assert(throws_config_error([&]
                                   { parse_server_arguments(bad_level.argc(), bad_level.argv(), no_env); }));

        const auto file = std::filesystem::temp_directory_path() / "chunkvault_config_test.json";
        {
            std::ofstream out(file);
            out << R"({"port": 8000, "root": "/srv/cv", "threads": 4, "remote_threshold": 1000,
                       "remote": {"folder_id": "folder", "refresh_token": "from-file", "client_id": "cid"}})";
        }
        Arguments with_file{"server", "--config", file.string(), "--port", "8001"};
        config = parse_server_arguments(with_file.argc(), with_file.argv(),
                                        environment({{"CHUNKVAULT_REMOTE_REFRESH_TOKEN", "from-env"},
                                                     {"CHUNKVAULT_REMOTE_CLIENT_SECRET", "secret"}}));
        assert(config.port == 8001);
        assert(config.root == "/srv/cv");
        assert(config.worker_threads == 4);
        assert(config.remote_threshold == 1000);
        assert(config.remote);
        assert(config.remote->folder_id == "folder");
        assert(config.remote->credentials.client_id == "cid");
        assert(config.remote->credentials.refresh_token == "from-env");
        assert(config.remote->credentials.client_secret == "secret");

        {
            std::ofstream out(file);
            out << R"({"port": 8000, "root": "/srv/cv", "remote": {"folder_id": "no-credentials"}})";
        }
        Arguments no_credentials{"server", "--config", file.string()};
        assert(throws_config_error([&]
                                   { parse_server_arguments(no_credentials.argc(), no_credentials.argv(), no_env); }));

        {
            std::ofstream out(file);
            out << "{ not json";
        }
        Arguments broken{"server", "--config", file.string()};
        assert(throws_config_error([&]
                                   { parse_server_arguments(broken.argc(), broken.argv(), no_env); }));
        std::filesystem::remove(file);

        Arguments env_only{"server", "--port", "1", "--root", "/tmp"};
        config = parse_server_arguments(env_only.argc(), env_only.argv(),
                                        environment({{"CHUNKVAULT_REMOTE_ACCESS_TOKEN", "token"}}));
        assert(config.remote && config.remote->credentials.access_token == "token");

        assert(usage("chunkvault-server").find("--port") != std::string::npos);
    }

} // namespace

void run_server_component_tests()
{
    test_streaming_sink_backpressure();
    test_streaming_sink_abort_and_failure();
    test_registry_lifecycle();
    test_engine_happy_path();
    test_engine_rejects_bad_chunks();
    test_engine_short_and_broken_bodies();
    test_engine_storage_failures();
    test_engine_cancel_reap_and_shutdown();
    test_engine_concurrent_same_offset();
    test_idle_reaper_timer();
    test_local_blob_store();
    test_routing_blob_store();
    test_remote_blob_store_upload_and_download();
    test_remote_blob_store_failures();
    test_remote_token_refresh();
    test_server_config();
}
