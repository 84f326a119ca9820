// Unit test for XRootD filesystem facade against the fake server.

#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include <algorithm>

#include "duckdb/common/error_data.hpp"
#include "test_utils.hpp"
#include "xrootd_exception.hpp"

using namespace duckdb; // NOLINT

namespace {

vector<string> Sorted(vector<string> values) {
	std::sort(values.begin(), values.end());
	return values;
}

// Seed a small tree under "//tmp/tree": a.txt, sub/b.txt, sub/deep/c.txt and empty/.
void SeedTree(FakeXRootDServer &server) {
	server.AddFile("//tmp/tree/a.txt", "aaa");
	server.AddFile("//tmp/tree/sub/b.txt", "bb");
	server.AddFile("//tmp/tree/sub/deep/c.txt", "c");
	server.AddDirectory("//tmp/tree/empty");
}

} // namespace

TEST_CASE("Fixture namespace", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto facade = helper.CreateFacade();

	REQUIRE(facade->ListDir() == vector<string> {"data"});
	REQUIRE(facade->ListDir("data") == vector<string> {"testa.txt"});
	REQUIRE(facade->IsDir("data"));
	REQUIRE(!facade->IsFile("data"));
	REQUIRE(facade->IsFile("data/testa.txt"));
	REQUIRE(!facade->IsDir("data/testa.txt"));
	REQUIRE(facade->Exists("data/testa.txt"));
	REQUIRE(!facade->Exists("data/missing.txt"));
	REQUIRE(!facade->IsFile("data/missing.txt"));
	REQUIRE(!facade->IsDir("data/missing"));

	const auto info = facade->GetInfo("data/testa.txt");
	REQUIRE(info.name == "testa.txt");
	REQUIRE(!info.is_dir);
	REQUIRE(info.size == 10);
	REQUIRE(!info.has_details);
	REQUIRE(!info.has_access);
	REQUIRE(!info.has_xrootd);
}

TEST_CASE("Construct facade", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto &fs = helper.GetFileSystem();

	REQUIRE_THROWS_AS(XRootDFS(fs, "http://localhost//tmp/"), XRootDInvalidPathException);
	REQUIRE_THROWS_AS(XRootDFS(fs, "root://localhost/tmp/"), XRootDInvalidPathException);
	REQUIRE_THROWS_AS(XRootDFS(fs, "root://localhost//tmp//data"), XRootDInvalidPathException);

	XRootDFS facade(fs, GetTestUrl("//tmp/?xrd.wantprot=krb5"), {{"authz", "token"}});
	REQUIRE(facade.GetBasePath() == "//tmp/");
	REQUIRE(facade.GetQueryArgs().size() == 2);
	REQUIRE(facade.GetRootUrl() == "root://localhost:1094/?xrd.wantprot=krb5&authz=token");
	REQUIRE(facade.GetPathUrl("data/testa.txt") == "root://localhost:1094//tmp/data/testa.txt");
	REQUIRE(facade.GetPathUrl("data/testa.txt", /*with_querystring=*/true) ==
	        "root://localhost:1094//tmp/data/testa.txt?xrd.wantprot=krb5&authz=token");

	// The remote client is bound to the root URL together with its query string.
	const auto root_urls = helper.GetClientFactory().GetRootUrls();
	REQUIRE(root_urls.back() == "root://localhost:1094/?xrd.wantprot=krb5&authz=token");

	// A key in both the URL and the extra arguments is rejected.
	REQUIRE_THROWS_AS(XRootDFS(fs, GetTestUrl("//tmp/?authz=a"), {{"authz", "b"}}), InvalidInputException);

	// Without query arguments the root URL is bare.
	auto plain_facade = helper.CreateFacade();
	REQUIRE(plain_facade->GetRootUrl() == TEST_ROOT_URL);
}

TEST_CASE("Resolve path", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto facade = helper.CreateFacade();

	REQUIRE(facade->ResolvePath("data") == "//tmp/data");
	REQUIRE(facade->ResolvePath("./data/../data/testa.txt") == "//tmp/data/testa.txt");
	REQUIRE(facade->ResolvePath("./") == "//tmp");
	REQUIRE(facade->ResolvePath("") == "//tmp");
	// Absolute paths under the base path are kept, others are taken relative to it.
	REQUIRE(facade->ResolvePath("/tmp/data") == "//tmp/data");
	REQUIRE(facade->ResolvePath("//tmp/data") == "//tmp/data");
	REQUIRE(facade->ResolvePath("/data") == "//tmp/data");
	REQUIRE(facade->ResolvePath("/tmpdata") == "//tmp/tmpdata");
	REQUIRE_THROWS_AS(facade->ResolvePath("../../etc"), XRootDBackReferenceException);

	auto root_facade = helper.CreateFacade("//");
	REQUIRE(root_facade->ResolvePath("tmp/data") == "//tmp/data");
	REQUIRE(root_facade->ListDir() == vector<string> {"tmp"});
}

TEST_CASE("List directory with options", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	SeedTree(helper.GetServer());
	auto facade = helper.CreateFacade();

	REQUIRE(Sorted(facade->ListDir("tree")) == vector<string> {"a.txt", "empty", "sub"});

	XRootDListOptions options;
	options.files_only = true;
	REQUIRE(facade->ListDir("tree", options) == vector<string> {"a.txt"});

	options = XRootDListOptions();
	options.dirs_only = true;
	REQUIRE(Sorted(facade->ListDir("tree", options)) == vector<string> {"empty", "sub"});

	options = XRootDListOptions();
	options.wildcard = "*.txt";
	REQUIRE(facade->ListDir("tree", options) == vector<string> {"a.txt"});

	options = XRootDListOptions();
	options.wildcard = "s?b";
	options.full = true;
	REQUIRE(facade->ListDir("./tree/", options) == vector<string> {"tree/sub"});

	options = XRootDListOptions();
	options.wildcard = "a.*";
	options.absolute = true;
	REQUIRE(facade->ListDir("tree", options) == vector<string> {"//tmp/tree/a.txt"});

	REQUIRE(facade->ListDir("tree/empty").empty());

	vector<string> visited;
	facade->IListDir("tree/sub", XRootDListOptions(), [&visited](const string &name) { visited.emplace_back(name); });
	REQUIRE(Sorted(visited) == vector<string> {"b.txt", "deep"});

	const auto entries = facade->ListDirInfo("tree/sub");
	REQUIRE(entries.size() == 2);
	for (const auto &cur_entry : entries) {
		REQUIRE(cur_entry.has_stat_info);
		if (cur_entry.name == "b.txt") {
			REQUIRE(cur_entry.stat_info.size == 2);
			REQUIRE(!cur_entry.stat_info.TestFlags(XRootDStatFlags::IS_DIR));
		} else {
			REQUIRE(cur_entry.name == "deep");
			REQUIRE(cur_entry.stat_info.TestFlags(XRootDStatFlags::IS_DIR));
		}
	}
}

TEST_CASE("List directory failures", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto &server = helper.GetServer();
	auto facade = helper.CreateFacade();

	// Conflicting filters are rejected before any remote call.
	server.ResetOperationCount();
	XRootDListOptions options;
	options.dirs_only = true;
	options.files_only = true;
	REQUIRE_THROWS_AS(facade->ListDir("data", options), InvalidInputException);
	REQUIRE(server.GetOperationCount(FakeXRootDOperation::DIRLIST) == 0);

	REQUIRE_THROWS_AS(facade->ListDir("missing"), XRootDResourceNotFoundException);
	REQUIRE_THROWS_AS(facade->ListDir("data/testa.txt"), XRootDResourceInvalidException);
}

TEST_CASE("Make directory", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto &server = helper.GetServer();
	auto facade = helper.CreateFacade();

	facade->MakeDir("new_dir");
	REQUIRE(server.IsDirectory("//tmp/new_dir"));

	REQUIRE_THROWS_AS(facade->MakeDir("new_dir"), XRootDDestinationExistsException);
	facade->MakeDir("new_dir", /*recursive=*/false, /*allow_recreate=*/true);

	REQUIRE_THROWS_AS(facade->MakeDir("a/b/c"), XRootDResourceNotFoundException);
	facade->MakeDir("a/b/c", /*recursive=*/true);
	REQUIRE(server.IsDirectory("//tmp/a/b/c"));

	// A file on the way is not a directory.
	REQUIRE_THROWS_AS(facade->MakeDir("data/testa.txt/sub", /*recursive=*/true), XRootDResourceInvalidException);
}

TEST_CASE("Remove file and directory", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto &server = helper.GetServer();
	SeedTree(server);
	auto facade = helper.CreateFacade();

	facade->Remove("tree/a.txt");
	REQUIRE(!server.HasPath("//tmp/tree/a.txt"));
	REQUIRE_THROWS_AS(facade->Remove("tree/a.txt"), XRootDResourceNotFoundException);
	REQUIRE_THROWS_AS(facade->Remove("tree/sub"), XRootDResourceErrorException);

	facade->RemoveDir("tree/empty");
	REQUIRE(!server.HasPath("//tmp/tree/empty"));
	REQUIRE_THROWS_AS(facade->RemoveDir("tree/sub"), XRootDDirectoryNotEmptyException);
	REQUIRE_THROWS_AS(facade->RemoveDir("data/testa.txt"), XRootDResourceInvalidException);
	REQUIRE_THROWS_AS(facade->RemoveDir("tree/sub", /*recursive=*/true), XRootDUnsupportedException);

	server.ResetOperationCount();
	facade->RemoveDir("tree/sub", /*recursive=*/false, /*force=*/true);
	REQUIRE(!server.HasPath("//tmp/tree/sub"));
	REQUIRE(server.IsDirectory("//tmp/tree"));
	// One removal per file and directory, plus the first attempt on the non-empty directory.
	REQUIRE(server.GetOperationCount(FakeXRootDOperation::RM) == 2);
	REQUIRE(server.GetOperationCount(FakeXRootDOperation::RMDIR) == 3);
}

TEST_CASE("Move file", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto &server = helper.GetServer();
	auto facade = helper.CreateFacade();

	facade->Move("data/testa.txt", "data/moved.txt");
	REQUIRE(!server.HasPath(TEST_FILE_PATH));
	REQUIRE(server.GetFileContent("//tmp/data/moved.txt") == TEST_FILE_CONTENT);

	server.AddFile("//tmp/data/other.txt", "other");
	REQUIRE_THROWS_AS(facade->Move("data/other.txt", "data/moved.txt"), XRootDDestinationExistsException);
	REQUIRE(server.GetFileContent("//tmp/data/moved.txt") == TEST_FILE_CONTENT);

	facade->Move("data/other.txt", "data/moved.txt", /*overwrite=*/true);
	REQUIRE(server.GetFileContent("//tmp/data/moved.txt") == "other");
	REQUIRE(!server.HasPath("//tmp/data/other.txt"));

	REQUIRE_THROWS_AS(facade->Move("data/missing.txt", "data/x.txt"), XRootDResourceNotFoundException);
	REQUIRE_THROWS_AS(facade->Move("data", "data2"), XRootDResourceInvalidException);
}

TEST_CASE("Move directory", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto &server = helper.GetServer();
	SeedTree(server);
	auto facade = helper.CreateFacade();

	facade->MoveDir("tree", "moved_tree");
	REQUIRE(!server.HasPath("//tmp/tree"));
	REQUIRE(server.GetFileContent("//tmp/moved_tree/sub/deep/c.txt") == "c");
	REQUIRE(server.IsDirectory("//tmp/moved_tree/empty"));

	REQUIRE_THROWS_AS(facade->MoveDir("moved_tree", "data"), XRootDDestinationExistsException);
	facade->MoveDir("moved_tree", "data", /*overwrite=*/true);
	REQUIRE(!server.HasPath(TEST_FILE_PATH));
	REQUIRE(server.GetFileContent("//tmp/data/a.txt") == "aaa");

	REQUIRE_THROWS_AS(facade->MoveDir("data/a.txt", "x"), XRootDResourceInvalidException);
	REQUIRE_THROWS_AS(facade->MoveDir("missing", "x"), XRootDResourceNotFoundException);
}

TEST_CASE("Rename", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto &server = helper.GetServer();
	auto facade = helper.CreateFacade();

	// Destination is relative to the directory of the source.
	facade->Rename("data/testa.txt", "testb.txt");
	REQUIRE(server.GetFileContent("//tmp/data/testb.txt") == TEST_FILE_CONTENT);
	REQUIRE(!server.HasPath(TEST_FILE_PATH));

	server.AddFile(TEST_FILE_PATH, "again");
	REQUIRE_THROWS_AS(facade->Rename("data/testa.txt", "testb.txt"), XRootDDestinationExistsException);
	REQUIRE_THROWS_AS(facade->Rename("data/missing.txt", "x.txt"), XRootDResourceNotFoundException);

	facade->Rename("data", "renamed");
	REQUIRE(server.IsDirectory("//tmp/renamed"));
}

TEST_CASE("Copy file", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto &server = helper.GetServer();
	auto facade = helper.CreateFacade();

	facade->Copy("data/testa.txt", "data/copy.txt");
	REQUIRE(server.GetFileContent("//tmp/data/copy.txt") == TEST_FILE_CONTENT);
	REQUIRE(server.GetFileContent(TEST_FILE_PATH) == TEST_FILE_CONTENT);
	REQUIRE(helper.GetClientFactory().GetCopyProcessCount() == 1);
	REQUIRE(server.GetOperationCount(FakeXRootDOperation::COPY) == 1);

	server.AddFile("//tmp/data/copy.txt", "stale");
	REQUIRE_THROWS_AS(facade->Copy("data/testa.txt", "data/copy.txt"), XRootDDestinationExistsException);
	facade->Copy("data/testa.txt", "data/copy.txt", /*overwrite=*/true);
	REQUIRE(server.GetFileContent("//tmp/data/copy.txt") == TEST_FILE_CONTENT);

	// An existing directory destination is replaced on overwrite.
	server.AddFile("//tmp/dst_dir/inner.txt", "inner");
	facade->Copy("data/testa.txt", "dst_dir", /*overwrite=*/true);
	REQUIRE(server.GetFileContent("//tmp/dst_dir") == TEST_FILE_CONTENT);

	REQUIRE_THROWS_AS(facade->Copy("data", "data_copy"), XRootDResourceInvalidException);
	REQUIRE_THROWS_AS(facade->Copy("data/missing.txt", "x.txt"), XRootDResourceNotFoundException);
}

TEST_CASE("Copy directory", "[xrootd fs test]") {
	const bool parallel = GENERATE(true, false);

	TestXRootDFileSystemHelper helper;
	auto &server = helper.GetServer();
	SeedTree(server);
	auto facade = helper.CreateFacade();

	facade->CopyDir("tree", "tree_copy", /*overwrite=*/false, parallel);
	REQUIRE(server.GetFileContent("//tmp/tree_copy/a.txt") == "aaa");
	REQUIRE(server.GetFileContent("//tmp/tree_copy/sub/b.txt") == "bb");
	REQUIRE(server.GetFileContent("//tmp/tree_copy/sub/deep/c.txt") == "c");
	REQUIRE(server.IsDirectory("//tmp/tree_copy/empty"));
	REQUIRE(server.GetOperationCount(FakeXRootDOperation::COPY) == 3);
	// A parallel copy submits all files through one copy process, a sequential copy uses one per file.
	REQUIRE(helper.GetClientFactory().GetCopyProcessCount() == (parallel ? 1 : 3));

	REQUIRE_THROWS_AS(facade->CopyDir("tree", "tree_copy", /*overwrite=*/false, parallel),
	                  XRootDDestinationExistsException);

	server.AddFile("//tmp/tree_copy/stale.txt", "stale");
	facade->CopyDir("tree", "tree_copy", /*overwrite=*/true, parallel);
	REQUIRE(!server.HasPath("//tmp/tree_copy/stale.txt"));
	REQUIRE(Sorted(facade->ListDir("tree_copy")) == vector<string> {"a.txt", "empty", "sub"});

	REQUIRE_THROWS_AS(facade->CopyDir("data/testa.txt", "x", /*overwrite=*/false, parallel),
	                  XRootDResourceInvalidException);
	REQUIRE_THROWS_AS(facade->CopyDir("missing", "x", /*overwrite=*/false, parallel),
	                  XRootDResourceNotFoundException);
}

TEST_CASE("Copy directory failure", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto &server = helper.GetServer();
	SeedTree(server);
	auto facade = helper.CreateFacade();

	server.InjectFailure(FakeXRootDOperation::COPY, XRootDStatus::Error(XRootDErrno::IO_ERROR, "copy failed"));
	try {
		facade->CopyDir("tree", "tree_copy");
		FAIL("copy should fail");
	} catch (XRootDResourceErrorException &ex) {
		REQUIRE(StringUtil::Contains(ErrorData(ex).RawMessage(), "copy failed"));
	}
}

TEST_CASE("Get info namespaces", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto &server = helper.GetServer();
	auto facade = helper.CreateFacade();

	server.ResetOperationCount();
	XRootDInfoNamespaces namespaces;
	namespaces.details = true;
	namespaces.access = true;
	namespaces.xrootd = true;
	const auto file_info = facade->GetInfo("data/testa.txt", namespaces);
	REQUIRE(server.GetOperationCount(FakeXRootDOperation::QUERY) == 1);
	REQUIRE(file_info.has_details);
	REQUIRE(file_info.type == XRootDResourceType::FILE);
	REQUIRE(file_info.created.IsValid());
	REQUIRE(file_info.modified.IsValid());
	REQUIRE(file_info.accessed.IsValid());
	REQUIRE(file_info.modified.GetIndex() >= file_info.created.GetIndex());
	REQUIRE(file_info.has_access);
	REQUIRE(file_info.uid == "*");
	REQUIRE(file_info.gid == "*");
	REQUIRE(file_info.has_xrootd);
	REQUIRE(file_info.readable);
	REQUIRE(file_info.writable);
	REQUIRE(!file_info.offline);

	const auto dir_info = facade->GetInfo("data", namespaces);
	REQUIRE(dir_info.is_dir);
	REQUIRE(dir_info.type == XRootDResourceType::DIRECTORY);

	// Only the basic namespace doesn't need a query.
	server.ResetOperationCount();
	facade->GetInfo("data");
	REQUIRE(server.GetOperationCount(FakeXRootDOperation::QUERY) == 0);

	REQUIRE_THROWS_AS(facade->GetInfo("missing"), XRootDResourceNotFoundException);
}

TEST_CASE("Get info with malformed timestamps", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto &server = helper.GetServer();
	auto facade = helper.CreateFacade();
	server.SetAttributeOverrides("oss.mt=99999999999999999999999&oss.ct=12ab&oss.at=1700000000");

	XRootDInfoNamespaces namespaces;
	namespaces.details = true;
	const auto file_info = facade->GetInfo("data/testa.txt", namespaces);
	REQUIRE(!file_info.modified.IsValid());
	REQUIRE(!file_info.created.IsValid());
	REQUIRE(file_info.accessed.IsValid());
	REQUIRE(file_info.accessed.GetIndex() == 1700000000);
}

TEST_CASE("Checksum", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto &server = helper.GetServer();
	auto facade = helper.CreateFacade();

	const auto checksum = facade->Checksum("data/testa.txt");
	REQUIRE(checksum.first == "adler32");
	REQUIRE(checksum.second.length() == 8);
	// Same content, same checksum.
	server.AddFile("//tmp/other.txt", TEST_FILE_CONTENT);
	REQUIRE(facade->Checksum("other.txt") == checksum);

	REQUIRE_THROWS_AS(facade->Checksum("data"), XRootDResourceInvalidException);
	REQUIRE_THROWS_AS(facade->Checksum("missing.txt"), XRootDResourceInvalidException);

	server.SetChecksumSupported(false);
	REQUIRE_THROWS_AS(facade->Checksum("data/testa.txt"), XRootDUnsupportedException);
}

TEST_CASE("Ping", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto &server = helper.GetServer();
	auto facade = helper.CreateFacade();

	facade->Ping();
	REQUIRE(server.GetOperationCount(FakeXRootDOperation::PING) == 1);

	server.SetReachable(false);
	try {
		facade->Ping();
		FAIL("ping should fail");
	} catch (XRootDRemoteConnectionException &ex) {
		REQUIRE(StringUtil::Contains(ErrorData(ex).RawMessage(), TEST_ROOT_URL));
	}
	// Namespace calls on an unreachable server are plain resource errors.
	REQUIRE_THROWS_AS(facade->ListDir("data"), XRootDResourceErrorException);
}

TEST_CASE("Open file through facade", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	auto facade = helper.CreateFacade();

	auto handle = facade->Open("data/testa.txt");
	REQUIRE(handle->GetPath() == GetTestUrl(TEST_FILE_PATH));
	REQUIRE(handle->Read() == TEST_FILE_CONTENT);

	XRootDFileOptions options;
	options.mode = "w";
	auto write_handle = facade->Open("data/new.txt", std::move(options));
	const string content = "new content";
	write_handle->Write(content);
	write_handle->Close();
	REQUIRE(facade->GetInfo("data/new.txt").size == content.length());
}

TEST_CASE("Client config forwarded to remote clients", "[xrootd fs test]") {
	TestXRootDFileSystemHelper helper;
	helper.GetConfig().request_timeout = 42;
	helper.GetConfig().connection_retry = 2;
	auto facade = helper.CreateFacade();

	const auto config = helper.GetClientFactory().GetLastClientConfig();
	REQUIRE(config.request_timeout == 42);
	REQUIRE(config.connection_retry == 2);
}

int main(int argc, char **argv) {
	int result = Catch::Session().run(argc, argv);
	return result;
}
