#pragma once

#include <errno.h>
#include <string.h>
#include <string>
#include <sys/stat.h>

namespace anemo::core {

/** mkdir -p. Returns false and fills *err when a component cannot be
 * created. */
inline bool ensure_dir(const std::string &path, std::string *err = nullptr) {
	if (path.empty())
		return true;
	std::string cur;
	size_t i = 0;
	if (path[0] == '/') {
		cur = "/";
		i = 1;
	}
	while (i <= path.size()) {
		const size_t next = path.find('/', i);
		const size_t end = (next == std::string::npos) ? path.size() : next;
		const std::string part = path.substr(i, end - i);
		i = (next == std::string::npos) ? path.size() + 1 : next + 1;
		if (part.empty() || part == ".")
			continue;
		if (!cur.empty() && cur.back() != '/')
			cur += "/";
		cur += part;
		if (part == "..")
			continue;
		const int rc = mkdir(cur.c_str(), 0755);
		if (rc == 0 || errno == EEXIST)
			continue;
		if (err)
			*err = "failed to create directory '" + cur +
				   "': " + strerror(errno);
		return false;
	}
	return true;
}

inline std::string base_of(const std::string &path) {
	const size_t pos = path.find_last_of('/');
	if (pos == std::string::npos)
		return path;
	return path.substr(pos + 1);
}

inline std::string join_path(const std::string &dir, const std::string &name) {
	if (dir.empty())
		return name;
	if (dir.back() == '/')
		return dir + name;
	return dir + "/" + name;
}

} // namespace anemo::core
