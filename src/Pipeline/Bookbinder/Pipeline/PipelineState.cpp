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

#include "PipelineState.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace Bookbinder::Pipeline {

std::string_view toString(PipelineState state) noexcept
{
	switch (state) {
	case PipelineState::Idle:
		return "Idle";
	case PipelineState::Acquiring:
		return "Acquiring";
	case PipelineState::Packing:
		return "Packing";
	case PipelineState::ManifestBuilt:
		return "ManifestBuilt";
	case PipelineState::Publishing:
		return "Publishing";
	case PipelineState::Done:
		return "Done";
	case PipelineState::Failed:
		return "Failed";
	default:
		return "Unknown";
	}
}

bool isTerminal(PipelineState state) noexcept
{
	return state == PipelineState::Done || state == PipelineState::Failed;
}

bool isTransitionAllowed(PipelineState from, PipelineState to) noexcept
{
	switch (from) {
	case PipelineState::Idle:
		return to == PipelineState::Acquiring;
	case PipelineState::Acquiring:
		return to == PipelineState::Packing || to == PipelineState::Failed;
	case PipelineState::Packing:
		return to == PipelineState::ManifestBuilt || to == PipelineState::Failed;
	case PipelineState::ManifestBuilt:
		return to == PipelineState::Publishing || to == PipelineState::Done;
	case PipelineState::Publishing:
		return to == PipelineState::Done || to == PipelineState::Failed;
	default:
		return false;
	}
}

PipelineStateMachine::PipelineStateMachine(std::shared_ptr<const Logger::ILogger> logger)
	: logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(PipelineStateMachine::PipelineStateMachine)"))
{
}

void PipelineStateMachine::transitionTo(PipelineState next)
{
	if (!isTransitionAllowed(state_, next)) {
		logger_->error("IllegalStateTransition", {{"from", toString(state_)}, {"to", toString(next)}});
		throw std::logic_error(
			fmt::format("IllegalStateTransition(PipelineStateMachine::transitionTo):{}->{}", toString(state_), toString(next)));
	}

	logger_->info("PipelineStateChanged", {{"from", toString(state_)}, {"to", toString(next)}});
	state_ = next;
}

} // namespace Bookbinder::Pipeline
