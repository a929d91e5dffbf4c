// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <stdlib.h>

/**
 * A directory below /tmp which is deleted recursively by the
 * destructor.
 */
class TemporaryDirectory {
	std::filesystem::path path;

public:
	TemporaryDirectory() {
		char tpl[] = "/tmp/multireader_test_XXXXXX";
		if (mkdtemp(tpl) == nullptr)
			throw std::runtime_error("mkdtemp() failed");

		path = tpl;
	}

	~TemporaryDirectory() noexcept {
		std::error_code ec;
		std::filesystem::remove_all(path, ec);
	}

	TemporaryDirectory(const TemporaryDirectory &) = delete;
	TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

	const std::filesystem::path &GetPath() const noexcept {
		return path;
	}

	/**
	 * Create a file with the given contents and return its path.
	 */
	std::string CreateFile(std::string_view name,
			       std::string_view contents) const {
		const auto file_path = path / name;
		std::ofstream out{file_path, std::ios::binary};
		out.write(contents.data(), contents.size());
		out.close();
		if (!out)
			throw std::runtime_error("Failed to write " + file_path.string());

		return file_path.string();
	}
};
