// This file contains test utility functions.

#pragma once

#include "duckdb/common/shared_ptr.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/main/database.hpp"
#include "fake_xrootd_client.hpp"
#include "xrootd_filesystem.hpp"
#include "xrootd_fs.hpp"
#include "xrootdfs_instance_state.hpp"

namespace duckdb {

// Server the fake clients pretend to talk to.
constexpr const char *TEST_ROOT_URL = "root://localhost:1094";

// Fixture namespace seeded on the fake server, a single file "//tmp/data/testa.txt".
constexpr const char *TEST_BASE_PATH = "//tmp/";
constexpr const char *TEST_DATA_DIR = "//tmp/data";
constexpr const char *TEST_FILE_PATH = "//tmp/data/testa.txt";
constexpr const char *TEST_FILE_CONTENT = "testa.txt\n";

// Full URL of [path] on the fake server, i.e. "//tmp/a" -> "root://localhost:1094//tmp/a".
string GetTestUrl(const string &path);

// Helper class to create a properly configured XRootDFileSystem for testing.
// This creates a DuckDB instance with the extension state properly initialized, remote clients are served by an
// in-memory fake server with the fixture namespace seeded.
class TestXRootDFileSystemHelper {
public:
	explicit TestXRootDFileSystemHelper(bool seed_fixture = true);
	~TestXRootDFileSystemHelper();

	XRootDFileSystem &GetFileSystem() {
		return *xrootd_fs;
	}
	FakeXRootDServer &GetServer() {
		return *server;
	}
	FakeXRootDClientFactory &GetClientFactory() {
		return *client_factory;
	}
	DatabaseInstance &GetDatabaseInstance() {
		return *db.instance;
	}
	// Get the config for inspection/modification
	XRootDInstanceConfig &GetConfig() {
		return instance_state->config;
	}

	// Facade rooted at [base_path] of the fake server.
	unique_ptr<XRootDFS> CreateFacade(const string &base_path = TEST_BASE_PATH);

private:
	DuckDB db;
	shared_ptr<FakeXRootDServer> server;
	shared_ptr<FakeXRootDClientFactory> client_factory;
	shared_ptr<XRootDInstanceState> instance_state;
	unique_ptr<XRootDFileSystem> xrootd_fs;
};

} // namespace duckdb
