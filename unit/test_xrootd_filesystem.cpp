// Unit test for the DuckDB virtual filesystem over XRootD URLs.

#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include <algorithm>

#include "duckdb/common/error_data.hpp"
#include "duckdb/common/file_open_flags.hpp"
#include "test_utils.hpp"
#include "xrootd_exception.hpp"
#include "xrootd_file_handle.hpp"

using namespace duckdb; // NOLINT

namespace {

const string TEST_FILE_URL = GetTestUrl(TEST_FILE_PATH);

string GetHandleMode(FileHandle &handle) {
	return handle.Cast<XRootDFileHandle>().GetMode().ToString();
}

} // namespace

TEST_CASE("Handle XRootD URLs only", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();
	REQUIRE(fs.CanHandleFile("root://localhost//tmp/a.csv"));
	REQUIRE(fs.CanHandleFile("roots://localhost:1094//tmp/a.csv"));
	REQUIRE(!fs.CanHandleFile("s3://bucket/a.csv"));
	REQUIRE(!fs.CanHandleFile("/tmp/a.csv"));
	REQUIRE(fs.GetName() == "XRootDFileSystem");
}

TEST_CASE("Open modes derived from open flags", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();

	{
		auto handle = fs.OpenFile(TEST_FILE_URL, FileOpenFlags::FILE_FLAGS_READ);
		REQUIRE(GetHandleMode(*handle) == "rb");
	}
	{
		auto handle = fs.OpenFile(TEST_FILE_URL, FileOpenFlags::FILE_FLAGS_READ | FileOpenFlags::FILE_FLAGS_WRITE);
		REQUIRE(GetHandleMode(*handle) == "r+b");
	}
	{
		auto handle = fs.OpenFile(TEST_FILE_URL, FileOpenFlags::FILE_FLAGS_WRITE | FileOpenFlags::FILE_FLAGS_APPEND);
		REQUIRE(GetHandleMode(*handle) == "ab");
		REQUIRE(fs.SeekPosition(*handle) == 10);
	}
	{
		auto handle = fs.OpenFile(GetTestUrl("//tmp/data/created.txt"),
		                          FileOpenFlags::FILE_FLAGS_WRITE | FileOpenFlags::FILE_FLAGS_FILE_CREATE);
		REQUIRE(GetHandleMode(*handle) == "w+b");
		REQUIRE(helper.GetServer().HasPath("//tmp/data/created.txt"));
	}
	{
		auto handle = fs.OpenFile(GetTestUrl("//tmp/data/appended.txt"), FileOpenFlags::FILE_FLAGS_WRITE |
		                                                                       FileOpenFlags::FILE_FLAGS_FILE_CREATE |
		                                                                       FileOpenFlags::FILE_FLAGS_APPEND);
		REQUIRE(GetHandleMode(*handle) == "wb");
	}
	{
		// An existing file is kept with create flag.
		auto handle =
		    fs.OpenFile(TEST_FILE_URL, FileOpenFlags::FILE_FLAGS_WRITE | FileOpenFlags::FILE_FLAGS_FILE_CREATE);
		REQUIRE(GetHandleMode(*handle) == "r+b");
		REQUIRE(fs.GetFileSize(*handle) == 10);
	}
	{
		auto handle =
		    fs.OpenFile(TEST_FILE_URL, FileOpenFlags::FILE_FLAGS_WRITE | FileOpenFlags::FILE_FLAGS_FILE_CREATE_NEW);
		REQUIRE(GetHandleMode(*handle) == "wb");
		REQUIRE(fs.GetFileSize(*handle) == 0);
	}
}

TEST_CASE("Open missing file", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();
	const auto missing_url = GetTestUrl("//tmp/data/missing.txt");

	REQUIRE_THROWS_AS(fs.OpenFile(missing_url, FileOpenFlags::FILE_FLAGS_READ), XRootDResourceNotFoundException);
	auto handle =
	    fs.OpenFile(missing_url, FileOpenFlags::FILE_FLAGS_READ | FileOpenFlags::FILE_FLAGS_NULL_IF_NOT_EXISTS);
	REQUIRE(handle == nullptr);

	REQUIRE_THROWS_AS(fs.OpenFile("root://:1094//tmp/a.txt", FileOpenFlags::FILE_FLAGS_READ),
	                  XRootDPathFormatException);
}

TEST_CASE("Sequential and positional reads", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();
	auto handle = fs.OpenFile(TEST_FILE_URL, FileOpenFlags::FILE_FLAGS_READ);

	REQUIRE(fs.GetFileSize(*handle) == 10);
	REQUIRE(fs.GetFileType(*handle) == FileType::FILE_TYPE_REGULAR);
	REQUIRE(fs.CanSeek());
	REQUIRE(!fs.OnDiskFile(*handle));

	string buffer(5, '\0');
	REQUIRE(fs.Read(*handle, &buffer[0], 5) == 5);
	REQUIRE(buffer == "testa");
	REQUIRE(fs.SeekPosition(*handle) == 5);

	fs.Read(*handle, &buffer[0], 3, /*location=*/6);
	REQUIRE(buffer.substr(0, 3) == "txt");
	REQUIRE(fs.SeekPosition(*handle) == 5);

	fs.Seek(*handle, 9);
	REQUIRE(fs.Read(*handle, &buffer[0], 5) == 1);
	REQUIRE(buffer[0] == '\n');

	fs.Reset(*handle);
	REQUIRE(fs.SeekPosition(*handle) == 0);

	// Positional reads past end of file are short.
	try {
		fs.Read(*handle, &buffer[0], 5, /*location=*/8);
		FAIL("short read should fail");
	} catch (IOException &ex) {
		REQUIRE(StringUtil::Contains(ErrorData(ex).RawMessage(), "Could not read all bytes"));
	}
}

TEST_CASE("Sequential and positional writes", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();
	auto &server = helper.GetServer();
	const auto url = GetTestUrl("//tmp/data/out.bin");

	auto handle = fs.OpenFile(url, FileOpenFlags::FILE_FLAGS_WRITE | FileOpenFlags::FILE_FLAGS_FILE_CREATE_NEW);
	string content = "hello";
	REQUIRE(fs.Write(*handle, &content[0], content.length()) == 5);
	REQUIRE(fs.SeekPosition(*handle) == 5);

	string patch = "J";
	fs.Write(*handle, &patch[0], patch.length(), /*location=*/0);
	REQUIRE(fs.SeekPosition(*handle) == 5);

	fs.FileSync(*handle);
	REQUIRE(server.GetOperationCount(FakeXRootDOperation::SYNC) == 1);
	REQUIRE(server.GetFileContent("//tmp/data/out.bin") == "Jello");

	fs.Truncate(*handle, 2);
	REQUIRE(fs.GetFileSize(*handle) == 2);
	REQUIRE(server.GetFileContent("//tmp/data/out.bin") == "Je");

	const auto modified = fs.GetLastModifiedTime(*handle);
	REQUIRE(modified > Timestamp::FromEpochSeconds(0));

	handle->Close();
	REQUIRE(server.GetOperationCount(FakeXRootDOperation::CLOSE) == 1);
}

TEST_CASE("Append through virtual filesystem", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();
	auto handle = fs.OpenFile(TEST_FILE_URL, FileOpenFlags::FILE_FLAGS_WRITE | FileOpenFlags::FILE_FLAGS_APPEND);

	string content = "more\n";
	fs.Write(*handle, &content[0], content.length());
	REQUIRE(helper.GetServer().GetFileContent(TEST_FILE_PATH) == "testa.txt\nmore\n");
}

TEST_CASE("File and directory existence", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();

	REQUIRE(fs.FileExists(TEST_FILE_URL));
	REQUIRE(!fs.DirectoryExists(TEST_FILE_URL));
	REQUIRE(fs.DirectoryExists(GetTestUrl(TEST_DATA_DIR)));
	REQUIRE(!fs.FileExists(GetTestUrl(TEST_DATA_DIR)));
	REQUIRE(!fs.FileExists(GetTestUrl("//tmp/data/missing.txt")));
	REQUIRE(!fs.DirectoryExists(GetTestUrl("//tmp/missing")));
}

TEST_CASE("Create and remove directories", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();
	auto &server = helper.GetServer();
	const auto dir_url = GetTestUrl("//tmp/new_dir");

	fs.CreateDirectory(dir_url);
	REQUIRE(server.IsDirectory("//tmp/new_dir"));
	// Creating an existing directory is fine.
	fs.CreateDirectory(dir_url);
	REQUIRE_THROWS_AS(fs.CreateDirectory(GetTestUrl("//tmp/a/b")), XRootDResourceNotFoundException);

	server.AddFile("//tmp/new_dir/sub/file.txt", "x");
	fs.RemoveDirectory(dir_url);
	REQUIRE(!server.HasPath("//tmp/new_dir"));
	REQUIRE_THROWS_AS(fs.RemoveDirectory(dir_url), XRootDResourceNotFoundException);
}

TEST_CASE("Remove files", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();
	auto &server = helper.GetServer();

	server.AddFile("//tmp/data/other.txt", "other");
	fs.RemoveFile(GetTestUrl("//tmp/data/other.txt"));
	REQUIRE(!server.HasPath("//tmp/data/other.txt"));
	REQUIRE_THROWS_AS(fs.RemoveFile(GetTestUrl("//tmp/data/other.txt")), XRootDResourceNotFoundException);

	REQUIRE(fs.TryRemoveFile(TEST_FILE_URL));
	REQUIRE(!server.HasPath(TEST_FILE_PATH));
	REQUIRE(!fs.TryRemoveFile(TEST_FILE_URL));
	// Directories are left alone.
	REQUIRE(!fs.TryRemoveFile(GetTestUrl(TEST_DATA_DIR)));
	REQUIRE(server.IsDirectory(TEST_DATA_DIR));
}

TEST_CASE("Move files", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();
	auto &server = helper.GetServer();

	server.AddFile("//tmp/data/target.txt", "stale");
	fs.MoveFile(TEST_FILE_URL, GetTestUrl("//tmp/data/target.txt"));
	REQUIRE(!server.HasPath(TEST_FILE_PATH));
	REQUIRE(server.GetFileContent("//tmp/data/target.txt") == TEST_FILE_CONTENT);

	REQUIRE_THROWS_AS(fs.MoveFile(GetTestUrl("//tmp/data/target.txt"), "root://otherhost:1094//tmp/data/x.txt"),
	                  InvalidInputException);
}

TEST_CASE("List files", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();
	helper.GetServer().AddFile("//tmp/data/sub/inner.txt", "inner");

	vector<std::pair<string, bool>> entries;
	REQUIRE(fs.ListFiles(GetTestUrl(TEST_DATA_DIR), [&entries](const string &name, bool is_dir) {
		entries.emplace_back(name, is_dir);
	}));
	std::sort(entries.begin(), entries.end());
	REQUIRE(entries.size() == 2);
	REQUIRE(entries[0] == std::make_pair(string("sub"), true));
	REQUIRE(entries[1] == std::make_pair(string("testa.txt"), false));

	REQUIRE(!fs.ListFiles(GetTestUrl("//tmp/missing"), [](const string &, bool) {}));
	REQUIRE(!fs.ListFiles(TEST_FILE_URL, [](const string &, bool) {}));
}

TEST_CASE("Glob files", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();
	auto &server = helper.GetServer();
	server.AddFile("//tmp/data/testb.txt", "testb.txt\n");
	server.AddFile("//tmp/data/other.csv", "a,b\n");
	server.AddDirectory("//tmp/data/dir.txt");

	auto matches = fs.Glob(GetTestUrl("//tmp/data/test*.txt"));
	REQUIRE(matches.size() == 2);
	REQUIRE(matches[0].path == GetTestUrl("//tmp/data/testa.txt"));
	REQUIRE(matches[1].path == GetTestUrl("//tmp/data/testb.txt"));

	// Directories are not matched.
	matches = fs.Glob(GetTestUrl("//tmp/data/*.txt"));
	REQUIRE(matches.size() == 2);

	// Character classes are recognized as glob patterns.
	matches = fs.Glob(GetTestUrl("//tmp/data/test[b].txt"));
	REQUIRE(matches.size() == 1);
	REQUIRE(matches[0].path == GetTestUrl("//tmp/data/testb.txt"));

	matches = fs.Glob(TEST_FILE_URL);
	REQUIRE(matches.size() == 1);
	REQUIRE(matches[0].path == TEST_FILE_URL);

	REQUIRE(fs.Glob(GetTestUrl("//tmp/data/missing.txt")).empty());
	REQUIRE(fs.Glob(GetTestUrl("//tmp/missing/*.txt")).empty());
	REQUIRE_THROWS_AS(fs.Glob(GetTestUrl("//tmp/*/testa.txt")), NotImplementedException);

	// Query string of the pattern is carried over to the matches.
	matches = fs.Glob(GetTestUrl("//tmp/data/*.csv?xrd.wantprot=krb5"));
	REQUIRE(matches.size() == 1);
	REQUIRE(matches[0].path == GetTestUrl("//tmp/data/other.csv?xrd.wantprot=krb5"));
}

TEST_CASE("Configured query arguments", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();
	helper.GetConfig().query = "xrd.wantprot=krb5&authz=token";

	{
		auto handle = fs.OpenFile(TEST_FILE_URL, FileOpenFlags::FILE_FLAGS_READ);
		REQUIRE(handle->GetPath() == TEST_FILE_URL + "?xrd.wantprot=krb5&authz=token");
	}
	{
		// Arguments in the URL take precedence over configured ones.
		auto handle = fs.OpenFile(TEST_FILE_URL + "?xrd.wantprot=gsi", FileOpenFlags::FILE_FLAGS_READ);
		REQUIRE(handle->GetPath() == TEST_FILE_URL + "?xrd.wantprot=gsi&authz=token");
	}

	// Settings updates apply to later opens.
	helper.GetConfig().query = "";
	auto handle = fs.OpenFile(TEST_FILE_URL, FileOpenFlags::FILE_FLAGS_READ);
	REQUIRE(handle->GetPath() == TEST_FILE_URL);
}

TEST_CASE("Error messages omit query strings", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();
	helper.GetConfig().query = "authz=secret-token";

	try {
		fs.OpenFile(GetTestUrl("//tmp/data/missing.txt"), FileOpenFlags::FILE_FLAGS_READ);
		FAIL("expected exception");
	} catch (XRootDResourceNotFoundException &ex) {
		const auto message = ErrorData(ex).RawMessage();
		REQUIRE(message.find("//tmp/data/missing.txt") != string::npos);
		REQUIRE(message.find("secret-token") == string::npos);
	}
}

TEST_CASE("Configured read buffer size", "[xrootd filesystem test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();
	auto &server = helper.GetServer();
	server.AddFile("//tmp/data/lines.txt", "one\ntwo\n");
	helper.GetConfig().read_buffer_size = 2;

	auto handle = fs.OpenFile(GetTestUrl("//tmp/data/lines.txt"), FileOpenFlags::FILE_FLAGS_READ);
	auto &xrootd_handle = handle->Cast<XRootDFileHandle>();
	server.ResetOperationCount();
	REQUIRE(xrootd_handle.ReadLine() == "one\n");
	REQUIRE(server.GetOperationCount(FakeXRootDOperation::READ) == 2);
}

TEST_CASE("Filesystem without instance state", "[xrootd filesystem test]") {
	DuckDB db;
	REQUIRE_THROWS_AS(CreateXRootDFileSystem(*db.instance), InternalException);
}

int main(int argc, char **argv) {
	int result = Catch::Session().run(argc, argv);
	return result;
}
