/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Pipeline Library
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

#pragma once

#include <memory>
#include <string_view>

#include <Bookbinder/Logger/ILogger.hpp>

namespace Bookbinder::Pipeline {

enum class PipelineState { Idle, Acquiring, Packing, ManifestBuilt, Publishing, Done, Failed };

std::string_view toString(PipelineState state) noexcept;

[[nodiscard]]
bool isTerminal(PipelineState state) noexcept;

[[nodiscard]]
bool isTransitionAllowed(PipelineState from, PipelineState to) noexcept;

/**
 * Tracks the state of one run.
 *
 * Idle -> Acquiring -> Packing -> ManifestBuilt -> [Publishing ->] Done.
 * Failed is reachable from Acquiring, Packing and Publishing.
 */
class PipelineStateMachine {
public:
	explicit PipelineStateMachine(std::shared_ptr<const Logger::ILogger> logger);

	[[nodiscard]]
	PipelineState state() const noexcept
	{
		return state_;
	}

	/// Throws std::logic_error when the transition is not allowed.
	void transitionTo(PipelineState next);

private:
	PipelineState state_ = PipelineState::Idle;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace Bookbinder::Pipeline
