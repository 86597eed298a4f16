#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "wavetrim/editor/core/DragState.hpp"
#include "wavetrim/editor/core/PlaybackState.hpp"
#include "wavetrim/editor/core/TrimSelection.hpp"

using wavetrim::DragState;
using wavetrim::DragTarget;
using wavetrim::PlaybackState;
using wavetrim::TrimSelection;

TEST_CASE("TrimSelection - fullRange covers the file", "[trim_selection]") {
    auto selection = TrimSelection::fullRange(12.5);
    REQUIRE(selection.start == 0.0);
    REQUIRE(selection.end == 12.5);
    REQUIRE(selection.length() == Catch::Approx(12.5));
}

TEST_CASE("TrimSelection - fullRange of a non-positive duration is empty", "[trim_selection]") {
    REQUIRE(TrimSelection::fullRange(0.0) == TrimSelection{0.0, 0.0});
    REQUIRE(TrimSelection::fullRange(-3.0) == TrimSelection{0.0, 0.0});
}

TEST_CASE("TrimSelection - equality compares both ends", "[trim_selection]") {
    REQUIRE(TrimSelection{1.0, 2.0} == TrimSelection{1.0, 2.0});
    REQUIRE(TrimSelection{1.0, 2.0} != TrimSelection{1.0, 2.5});
    REQUIRE(TrimSelection{1.5, 2.0} != TrimSelection{1.0, 2.0});
}

TEST_CASE("PlaybackState - zero duration means no file", "[playback_state]") {
    PlaybackState empty;
    REQUIRE_FALSE(empty.hasFile());

    PlaybackState loaded{true, 3.2, 10.0};
    REQUIRE(loaded.hasFile());
    REQUIRE(loaded != empty);
    REQUIRE(loaded == PlaybackState{true, 3.2, 10.0});
}

TEST_CASE("DragState - begin on None stays inactive", "[drag_state]") {
    DragState drag;
    drag.begin(DragTarget::None);
    REQUIRE_FALSE(drag.active);

    drag.begin(DragTarget::Playhead);
    REQUIRE(drag.active);
    REQUIRE(drag.target == DragTarget::Playhead);

    drag.end();
    REQUIRE_FALSE(drag.active);
    REQUIRE(drag.target == DragTarget::None);
}
