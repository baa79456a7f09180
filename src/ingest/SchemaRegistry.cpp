#include "ingest/SchemaRegistry.h"

#include "config/Config.h"

namespace ingest {

SchemaRegistry::SchemaRegistry() {
	columns_.emplace_back(cfg::TIMESTAMP_COLUMN);
	known_.insert(cfg::TIMESTAMP_COLUMN);
}

bool SchemaRegistry::observe(const FieldMap &fields) {
	bool changed = false;
	for (const auto &f : fields) {
		if (known_.insert(f.first).second) {
			columns_.push_back(f.first);
			changed = true;
		}
	}
	return changed;
}

bool SchemaRegistry::contains(const std::string &name) const {
	return known_.count(name) != 0;
}

} // namespace ingest
