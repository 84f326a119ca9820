#pragma once

#include "duckdb/common/string.hpp"
#include "duckdb/main/extension.hpp"

namespace duckdb {

class XRootDFsExtension : public Extension {
public:
	void Load(ExtensionLoader &loader) override;
	string Name() override;
	string Version() const override;
};

} // namespace duckdb
