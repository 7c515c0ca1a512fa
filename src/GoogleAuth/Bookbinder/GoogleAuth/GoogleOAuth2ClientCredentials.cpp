/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder GoogleAuth Library
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

#include "GoogleOAuth2ClientCredentials.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace Bookbinder::GoogleAuth {

void to_json(nlohmann::json &j, const GoogleOAuth2ClientCredentials &p)
{
	j = nlohmann::json{{"ver", p.ver}, {"client_id", p.client_id}, {"client_secret", p.client_secret}};
}

void from_json(const nlohmann::json &j, GoogleOAuth2ClientCredentials &p)
{
	if (auto it = j.find("ver"); it != j.end()) {
		it->get_to(p.ver);
	}
	j.at("client_id").get_to(p.client_id);
	j.at("client_secret").get_to(p.client_secret);
}

GoogleOAuth2ClientCredentials loadClientCredentialsFile(const std::filesystem::path &path)
{
	std::ifstream ifs(path);
	if (!ifs.is_open()) {
		throw std::runtime_error("FileOpenError(loadClientCredentialsFile):" + path.string());
	}

	nlohmann::json j = nlohmann::json::parse(ifs);

	for (const char *key : {"installed", "web"}) {
		if (auto it = j.find(key); it != j.end() && it->is_object()) {
			return it->get<GoogleOAuth2ClientCredentials>();
		}
	}

	throw std::runtime_error("UnknownClientTypeError(loadClientCredentialsFile):" + path.string());
}

} // namespace Bookbinder::GoogleAuth
