/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder GoogleDriveApi Library
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "GoogleDriveTypes.hpp"

#include <nlohmann/json.hpp>

namespace Bookbinder::GoogleDriveApi {

void to_json(nlohmann::json &j, const GoogleDriveFile &p)
{
	j = nlohmann::json{{"kind", p.kind}, {"id", p.id}, {"name", p.name}, {"mimeType", p.mimeType}};

	if (!p.parents.empty()) {
		j["parents"] = p.parents;
	}

	// The API represents int64 values as strings.
	if (p.size.has_value()) {
		j["size"] = std::to_string(p.size.value());
	}
}

void from_json(const nlohmann::json &j, GoogleDriveFile &p)
{
	p.kind = j.value("kind", "");
	j.at("id").get_to(p.id);
	p.name = j.value("name", "");
	p.mimeType = j.value("mimeType", "");

	if (auto it = j.find("parents"); it != j.end() && it->is_array()) {
		it->get_to(p.parents);
	} else {
		p.parents.clear();
	}

	if (auto it = j.find("size"); it != j.end() && !it->is_null()) {
		if (it->is_string()) {
			p.size = std::stoull(it->get<std::string>());
		} else {
			p.size = it->get<std::uint64_t>();
		}
	} else {
		p.size = std::nullopt;
	}
}

void to_json(nlohmann::json &j, const GoogleDriveFileMetadata &p)
{
	j = nlohmann::json{{"name", p.name}};

	if (p.mimeType.has_value()) {
		j["mimeType"] = p.mimeType.value();
	}

	if (!p.parents.empty()) {
		j["parents"] = p.parents;
	}
}

} // namespace Bookbinder::GoogleDriveApi
