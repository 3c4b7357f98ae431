/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "session_snapshot.hpp"
#include "core/logger.hpp"
#include "edit_session.hpp"

#include <algorithm>
#include <utility>

namespace vxa::edit::op {

    namespace {

        bool same(const core::AxisReference& a, const core::AxisReference& b) {
            return a.defined == b.defined && a.p1 == b.p1 && a.p2 == b.p2 && a.axis == b.axis;
        }

        bool same(const core::PlaneReference& a, const core::PlaneReference& b) {
            return a.defined == b.defined && a.p1 == b.p1 && a.p2 == b.p2 && a.p3 == b.p3 &&
                   a.normal == b.normal;
        }

    } // namespace

    SessionSnapshot::SessionSnapshot(EditSession& session, std::string name)
        : session_(session),
          name_(std::move(name)) {}

    void SessionSnapshot::captureBefore() {
        vertices_ = session_.mesh().selection();
        before_ = capture();
    }

    void SessionSnapshot::captureAfter() {
        after_ = capture();
    }

    bool SessionSnapshot::hasChanges() const {
        return before_.positions != after_.positions || !same(before_.axis, after_.axis) ||
               !same(before_.plane, after_.plane) || before_.guide_visible != after_.guide_visible;
    }

    void SessionSnapshot::undo() {
        restore(before_);
    }

    void SessionSnapshot::redo() {
        restore(after_);
    }

    SessionSnapshot::State SessionSnapshot::capture() const {
        State state;
        const auto& mesh = session_.mesh();
        state.positions.reserve(vertices_.size());
        for (const auto idx : vertices_) {
            if (idx < mesh.vertexCount()) {
                state.positions.push_back(mesh.position(idx));
            }
        }
        state.axis = session_.axis();
        state.plane = session_.plane();
        state.guide_visible = session_.axisGuideVisible();
        return state;
    }

    void SessionSnapshot::restore(const State& state) {
        auto& mesh = session_.mesh();
        const size_t count = std::min(vertices_.size(), state.positions.size());
        for (size_t i = 0; i < count; ++i) {
            if (!mesh.setPosition(vertices_[i], state.positions[i])) {
                LOG_WARN("{}: vertex {} no longer exists", name_, vertices_[i]);
            }
        }
        session_.setAxis(state.axis);
        session_.setPlane(state.plane);
        session_.setAxisGuideVisible(state.guide_visible);
    }

} // namespace vxa::edit::op
