#include <cassert>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "tinyftp/client/logger.hpp"
#include "tinyftp/client/transfer_engine.hpp"
#include "tinyftp/crypto.hpp"
#include "tinyftp/protocol.hpp"
#include "tinyftp/size_format.hpp"

using namespace tinyftp;
using namespace tinyftp::client;
using tinyftp::test::read_file;
using tinyftp::test::ScriptedChannel;
using tinyftp::test::TempDir;
using tinyftp::test::write_file;

namespace
{

    struct EngineFixture
    {
        explicit EngineFixture(const std::string &name, bool overwrite = false)
            : dir(name),
              logger(dir / "client.log", false),
              engine(channel, Endpoint{.host = "127.0.0.1", .port = 2121}, logger, console,
                     TransferOptions{.working_directory = dir.path(), .overwrite_existing = overwrite})
        {
        }

        std::string log_text() const
        {
            return read_file(dir / "client.log");
        }

        TempDir dir;
        ScriptedChannel channel;
        std::ostringstream console;
        Logger logger;
        TransferEngine engine;
    };

    bool contains(const std::string &haystack, const std::string &needle)
    {
        return haystack.find(needle) != std::string::npos;
    }

    std::string digest_of(const std::string &content)
    {
        crypto::TransferDigest digest;
        digest.update(content);
        return digest.finish();
    }

    void test_put_streams_ten_mebibytes()
    {
        EngineFixture fx("put_10mib");
        const auto content = tinyftp::test::make_content(10 * 1024 * 1024);
        write_file(fx.dir / "report.pdf", content);
        fx.channel.reply("FileOkTransfer");

        const auto status = fx.engine.put_file("report.pdf");
        assert(status.ok());

        assert(fx.channel.connect_calls == 1);
        assert(fx.channel.last_host == "127.0.0.1");
        assert(fx.channel.last_port == 2121);
        assert(fx.channel.receive_limits.size() == 1);
        assert(fx.channel.receive_limits[0] == protocol::kPutReadyResponseBytes);

        assert(fx.channel.sent.size() == 2 + 2560);
        assert(fx.channel.sent[0] == "PUT report.pdf");
        assert(fx.channel.sent[1] == "10485760");
        for (std::size_t i = 2; i < fx.channel.sent.size(); ++i)
        {
            assert(fx.channel.sent[i].size() == protocol::kChunkSize);
        }
        assert(fx.channel.sent_after(2) == content);

        assert(contains(fx.log_text(), "[UPL] Upload Complete 'report.pdf' [10.00MB / 10.00MB]"));
        assert(contains(fx.log_text(), "[SUM] report.pdf blake2b:" + digest_of(content) + " (10485760 bytes on the wire)"));
        assert(contains(fx.console.str(), "[UPL] Uploading 'report.pdf' [4.00KB / 10.00MB]"));
    }

    void test_put_short_last_chunk()
    {
        EngineFixture fx("put_short_chunk");
        write_file(fx.dir / "notes.txt", std::string(5000, 'n'));
        fx.channel.reply("FileOkTransfer");

        assert(fx.engine.put_file("notes.txt").ok());
        assert(fx.channel.sent.size() == 4);
        assert(fx.channel.sent[1] == "5000");
        assert(fx.channel.sent[2].size() == 4096);
        assert(fx.channel.sent[3].size() == 904);
    }

    void test_put_rejects_long_filename()
    {
        EngineFixture fx("put_long_name");
        const std::string filename(300, 'a');

        const auto status = fx.engine.put_file(filename);
        assert(status.code() == ErrorCode::FileNameTooLong);
        assert(contains(status.message(), "Filename of file is too long (over 255 chars)"));
        assert(fx.channel.sent.size() == 1);
        assert(fx.channel.sent[0] == "FileNameTooLong");
        assert(fx.channel.receive_limits.empty());
    }

    void test_put_rejects_zero_sized_file()
    {
        EngineFixture fx("put_zero");
        write_file(fx.dir / "empty.bin", "");

        const auto status = fx.engine.put_file("empty.bin");
        assert(status.code() == ErrorCode::FileZeroSized);
        assert(fx.channel.sent.size() == 1);
        assert(fx.channel.sent[0] == "FileZeroSized");
        assert(fx.channel.receive_limits.empty());
    }

    void test_put_rejects_missing_file_and_directory()
    {
        EngineFixture fx("put_missing");
        auto status = fx.engine.put_file("absent.txt");
        assert(status.code() == ErrorCode::FileNotFound);
        assert(status.message() == "FileNotFound: File could not be found in current directory");
        assert(fx.channel.sent.back() == "FileNotFound");

        std::filesystem::create_directories(fx.dir / "folder");
        status = fx.engine.put_file("folder");
        assert(status.code() == ErrorCode::FileIsDirectory);
        assert(fx.channel.sent.back() == "FileIsDirectory");

        // Only entries of the working directory itself can be uploaded.
        std::filesystem::create_directories(fx.dir / "nested");
        write_file(fx.dir / "nested" / "inner.txt", "data");
        status = fx.engine.put_file("nested/inner.txt");
        assert(status.code() == ErrorCode::FileNotFound);

        for (const auto &message : fx.channel.sent)
        {
            assert(message.rfind("PUT ", 0) != 0);
        }
    }

    void test_put_rejection_without_server()
    {
        EngineFixture fx("put_no_server");
        fx.channel.refuse_connect = true;

        const auto status = fx.engine.put_file("absent.txt");
        assert(status.code() == ErrorCode::FileNotFound);
        assert(fx.channel.sent.empty());
        assert(contains(fx.log_text(), "[WRN] Could not notify server of FileNotFound"));
    }

    void test_put_server_error_token()
    {
        EngineFixture fx("put_server_error");
        write_file(fx.dir / "dup.txt", "duplicate");
        fx.channel.reply("FileAlreadyExists");

        const auto status = fx.engine.put_file("dup.txt");
        assert(status.code() == ErrorCode::FileAlreadyExists);
        assert(status.message() == "Server response: \"FileAlreadyExists\" - File already exists in current directory");
        assert(fx.channel.sent.size() == 1);
        assert(fx.channel.sent[0] == "PUT dup.txt");
    }

    void test_put_unexpected_response()
    {
        EngineFixture fx("put_unexpected");
        write_file(fx.dir / "data.txt", "payload");
        fx.channel.reply("READY");

        auto status = fx.engine.put_file("data.txt");
        assert(status.code() == ErrorCode::UnexpectedResponse);
        assert(fx.channel.sent.size() == 1);

        EngineFixture closed("put_closed");
        write_file(closed.dir / "data.txt", "payload");
        status = closed.engine.put_file("data.txt");
        assert(status.code() == ErrorCode::UnexpectedResponse);
    }

    void test_put_send_failure_propagates()
    {
        EngineFixture fx("put_send_failure");
        write_file(fx.dir / "data.txt", tinyftp::test::make_content(10000));
        fx.channel.reply("FileOkTransfer");
        fx.channel.fail_sends_after = 3;

        const auto status = fx.engine.put_file("data.txt");
        assert(status.code() == ErrorCode::TransportFailed);
        assert(!contains(fx.log_text(), "Upload Complete"));
    }

    void test_get_missing_remote_file()
    {
        EngineFixture fx("get_missing");
        fx.channel.reply("FileNotFound");

        const auto status = fx.engine.get_file("missing.txt");
        assert(status.code() == ErrorCode::FileNotFound);
        assert(contains(status.message(), "File could not be found in current directory"));
        assert(fx.channel.sent.size() == 1);
        assert(fx.channel.sent[0] == "GET missing.txt");
        assert(fx.channel.receive_limits[0] == protocol::kGetSizeResponseBytes);
        assert(!std::filesystem::exists(fx.dir / "missing.txt"));
    }

    void test_get_keeps_overshooting_chunk()
    {
        EngineFixture fx("get_overshoot");
        fx.channel.reply("10");
        fx.channel.reply("0123456");
        fx.channel.reply("789ABC");
        fx.channel.reply("never read");

        const auto status = fx.engine.get_file("digits.txt");
        assert(status.ok());
        assert(read_file(fx.dir / "digits.txt") == "0123456789ABC");
        assert(fx.channel.replies.size() == 1);
        assert(contains(fx.log_text(), "[DWN] Download Complete 'digits.txt' [13.00B / 10.00B]"));
        assert(contains(fx.log_text(), "[SUM] digits.txt blake2b:" + digest_of("0123456789ABC") + " (13 bytes"));
        for (std::size_t i = 1; i < fx.channel.receive_limits.size(); ++i)
        {
            assert(fx.channel.receive_limits[i] == protocol::kChunkSize);
        }
    }

    void test_get_info_token_before_size()
    {
        EngineFixture fx("get_info");
        fx.channel.reply("FileOkTransfer");
        fx.channel.reply("4");
        fx.channel.reply("abcd");

        assert(fx.engine.get_file("four.txt").ok());
        assert(read_file(fx.dir / "four.txt") == "abcd");
        assert(contains(fx.log_text(), "Server response: \"FileOkTransfer\""));
    }

    void test_get_rejects_unparseable_size()
    {
        EngineFixture fx("get_bad_size");
        fx.channel.reply("twelve");

        const auto status = fx.engine.get_file("bad.txt");
        assert(status.code() == ErrorCode::UnexpectedResponse);
        assert(!std::filesystem::exists(fx.dir / "bad.txt"));

        EngineFixture closed("get_no_size");
        assert(closed.engine.get_file("bad.txt").code() == ErrorCode::UnexpectedResponse);
    }

    void test_get_truncated_stream_leaves_partial_file()
    {
        EngineFixture fx("get_truncated");
        fx.channel.reply("100");
        fx.channel.reply("only forty bytes of the announced hundred");

        const auto status = fx.engine.get_file("partial.bin");
        assert(status.code() == ErrorCode::TransportFailed);
        assert(std::filesystem::exists(fx.dir / "partial.bin"));
        assert(std::filesystem::file_size(fx.dir / "partial.bin") == 41);
    }

    void test_get_existing_local_file()
    {
        EngineFixture fx("get_existing");
        write_file(fx.dir / "local.txt", "original");

        const auto status = fx.engine.get_file("local.txt");
        assert(status.code() == ErrorCode::FileAlreadyExists);
        assert(fx.channel.connect_calls == 0);
        assert(read_file(fx.dir / "local.txt") == "original");

        EngineFixture overwrite("get_overwrite", true);
        write_file(overwrite.dir / "local.txt", "original");
        overwrite.channel.reply("7");
        overwrite.channel.reply("updated");
        assert(overwrite.engine.get_file("local.txt").ok());
        assert(read_file(overwrite.dir / "local.txt") == "updated");
        assert(contains(overwrite.log_text(), "[WRN] 'local.txt' already exists locally and will be overwritten."));
    }

    void test_paths_resolve_against_working_directory()
    {
        EngineFixture fx("working_dir_engine");
        TempDir elsewhere("working_dir_elsewhere");
        write_file(elsewhere / "stray.txt", "not here");
        tinyftp::test::ScopedCurrentPath cwd(elsewhere.path());

        const auto status = fx.engine.put_file("stray.txt");
        assert(status.code() == ErrorCode::FileNotFound);
        assert(fx.channel.sent == (std::vector<std::string>{"FileNotFound"}));

        write_file(fx.dir / "stray.txt", "right here");
        fx.channel.reply("FileOkTransfer");
        assert(fx.engine.put_file("stray.txt").ok());
        assert(fx.channel.sent_after(3) == "right here");
    }

    void test_upload_then_download_roundtrip()
    {
        EngineFixture up("roundtrip_up");
        const auto content = tinyftp::test::make_content(10000);
        write_file(up.dir / "source.bin", content);
        up.channel.reply("FileOkTransfer");
        assert(up.engine.put_file("source.bin").ok());

        const auto uploaded = up.channel.sent_after(2);
        assert(uploaded == content);

        EngineFixture down("roundtrip_down");
        down.channel.reply(up.channel.sent[1]);
        for (std::size_t i = 2; i < up.channel.sent.size(); ++i)
        {
            down.channel.reply(up.channel.sent[i]);
        }
        assert(down.engine.get_file("copy.bin").ok());
        assert(read_file(down.dir / "copy.bin") == content);

        const std::string final_progress = "[" + format_size(content.size()) + " / " + format_size(content.size()) + "]";
        assert(final_progress == "[9.77KB / 9.77KB]");
        assert(contains(down.console.str(), "[DWN] Downloading 'copy.bin' " + final_progress));
        assert(contains(down.log_text(), "Download Complete 'copy.bin' " + final_progress));

        const auto expected = " blake2b:" + digest_of(content) + " (10000 bytes on the wire)";
        assert(contains(up.log_text(), "[SUM] source.bin" + expected));
        assert(contains(down.log_text(), "[SUM] copy.bin" + expected));
    }

    // Sparse files keep these cheap on disk; nothing past validation is read.
    void test_put_size_limit_boundary()
    {
        EngineFixture over("put_over_limit");
        write_file(over.dir / "huge.bin", "");
        std::filesystem::resize_file(over.dir / "huge.bin", protocol::kMaxFileSize + 1);

        auto status = over.engine.put_file("huge.bin");
        assert(status.code() == ErrorCode::FileTooLarge);
        assert(status.message() == "FileTooLarge: File is too large to transfer (over 5GB in size)");
        assert(over.channel.sent == (std::vector<std::string>{"FileTooLarge"}));

        EngineFixture limit("put_at_limit");
        write_file(limit.dir / "big.bin", "");
        std::filesystem::resize_file(limit.dir / "big.bin", 5368709120ULL);

        status = limit.engine.put_file("big.bin");
        assert(status.code() == ErrorCode::UnexpectedResponse);
        assert(limit.channel.sent == (std::vector<std::string>{"PUT big.bin"}));
        assert(contains(limit.log_text(), "File 'big.bin' found in client directory."));
    }

    void test_list_prints_listing()
    {
        EngineFixture fx("list_ok");
        fx.channel.reply("report.pdf\nnotes.txt");

        assert(fx.engine.show_list().ok());
        assert(fx.channel.sent.size() == 1);
        assert(fx.channel.sent[0] == "LIST");
        assert(fx.channel.receive_limits[0] == protocol::kListResponseBytes);
        assert(contains(fx.log_text(), "Server responded with:\nreport.pdf\nnotes.txt"));
    }

    void test_list_empty_response()
    {
        EngineFixture fx("list_empty");
        const auto status = fx.engine.show_list();
        assert(status.code() == ErrorCode::EmptyListing);
        assert(status.message() == "Server responded without a file list.");
    }

    void test_connection_failure()
    {
        EngineFixture fx("connect_refused");
        fx.channel.refuse_connect = true;
        const auto status = fx.engine.show_list();
        assert(status.code() == ErrorCode::ConnectionFailed);
        assert(contains(status.message(), "127.0.0.1:2121"));
        assert(fx.channel.sent.empty());
    }

    void test_progress_render()
    {
        TransferProgress progress{.transferred = 0, .total = 2048};
        assert(!progress.complete());
        progress.advance(1024);
        assert(progress.render() == "[1024.00B / 2.00KB]");
        progress.advance(1024);
        assert(progress.complete());
        assert(progress.render() == "[2.00KB / 2.00KB]");
    }

} // namespace

void run_client_transfer_tests()
{
    test_progress_render();
    test_put_streams_ten_mebibytes();
    test_put_short_last_chunk();
    test_put_rejects_long_filename();
    test_put_rejects_zero_sized_file();
    test_put_size_limit_boundary();
    test_put_rejects_missing_file_and_directory();
    test_put_rejection_without_server();
    test_put_server_error_token();
    test_put_unexpected_response();
    test_put_send_failure_propagates();
    test_get_missing_remote_file();
    test_get_keeps_overshooting_chunk();
    test_get_info_token_before_size();
    test_get_rejects_unparseable_size();
    test_get_truncated_stream_leaves_partial_file();
    test_get_existing_local_file();
    test_paths_resolve_against_working_directory();
    test_upload_then_download_roundtrip();
    test_list_prints_listing();
    test_list_empty_response();
    test_connection_failure();
}
