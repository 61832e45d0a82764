#include <managers/CursorOverrideManager.hpp>
#include <managers/PlaneLocator.hpp>
#include "../fakes/FakeDrm.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>

using namespace std::chrono_literals;

namespace {
    constexpr int         FD       = 5;
    constexpr uint32_t    CRTC     = 31;
    constexpr const char* SETTINGS = "/cfg/cursor.conf";

    class CursorOverride : public ::testing::Test {
      protected:
        void SetUp() override {
            drm = makeShared<CFakeDrmCalls>();
            fs  = makeShared<CFakeFileStat>();
        }

        UP<CCursorOverrideManager> make(const std::string& settings = "", SEnvOverrides env = {}) {
            fs->write(SETTINGS, settings);

            CCursorOverrideManager::SOptions options;
            options.settingsPath = SETTINGS;
            options.controlPaths = SControlPaths{.refresh = "/run/refresh", .type = "/run/type", .scale = "/run/scale", .custom = "/run/custom"};
            options.env          = env;
            // ticks are driven by hand
            options.fadeInterval = 1h;

            return makeUnique<CCursorOverrideManager>(drm, fs, options);
        }

        int showAtomic(CCursorOverrideManager& m, uint64_t hostFb = 77) {
            return m.onAtomicAddProperty(FD, nullptr, CFakeDrmCalls::CURSOR_PLANE, CFakeDrmCalls::PROP_FB_ID, hostFb);
        }

        int hideAtomic(CCursorOverrideManager& m) {
            return m.onAtomicAddProperty(FD, nullptr, CFakeDrmCalls::CURSOR_PLANE, CFakeDrmCalls::PROP_FB_ID, 0);
        }

        void refresh(CCursorOverrideManager& m) {
            fs->touch("/run/refresh");
            m.onAtomicAddProperty(FD, nullptr, CFakeDrmCalls::CURSOR_PLANE, CFakeDrmCalls::PROP_CRTC_X, 10);
        }

        bool mappingIsBlank() const {
            return std::ranges::all_of(drm->mapping, [](uint8_t b) { return b == 0; });
        }

        SP<CFakeDrmCalls> drm;
        SP<CFakeFileStat> fs;
    };
}

TEST_F(CursorOverride, passesThroughWithoutCursorPlane) {
    drm->planes = {CFakeDrmCalls::PRIMARY_PLANE};
    auto m      = make();

    EXPECT_EQ(m->onSetCursor(FD, CRTC, 9, 64, 64), 0);
    EXPECT_EQ(drm->last().name, "setCursor");
    EXPECT_EQ(drm->last().bo, 9u);
    EXPECT_EQ(drm->last().width, 64u);

    EXPECT_EQ(m->onMoveCursor(FD, CRTC, 10, 20), 0);
    EXPECT_EQ(drm->last().name, "moveCursor");
    EXPECT_EQ(drm->last().x, 10);
    EXPECT_EQ(drm->last().y, 20);

    EXPECT_EQ(m->onAtomicAddProperty(FD, nullptr, CFakeDrmCalls::PRIMARY_PLANE, CFakeDrmCalls::PROP_FB_ID, 77), 1);
    EXPECT_EQ(drm->last().value, 77u);

    EXPECT_EQ(drm->createdDumbs, 0);
}

TEST_F(CursorOverride, unknownDeviceHandlePassesThrough) {
    auto m = make();

    EXPECT_EQ(m->onAtomicAddProperty(-1, nullptr, CFakeDrmCalls::CURSOR_PLANE, CFakeDrmCalls::PROP_FB_ID, 77), 1);
    EXPECT_EQ(drm->last().value, 77u);
    EXPECT_EQ(drm->createdDumbs, 0);
}

TEST_F(CursorOverride, atomicSubstitutesFramebufferAndSize) {
    auto m = make();

    EXPECT_EQ(showAtomic(*m), 1);
    EXPECT_EQ(drm->last().value, CFakeDrmCalls::OUR_FB);
    EXPECT_EQ(m->framebufferId(), CFakeDrmCalls::OUR_FB);
    EXPECT_EQ(drm->createdDumbs, 1);
    EXPECT_FALSE(mappingIsBlank());

    m->onAtomicAddProperty(FD, nullptr, CFakeDrmCalls::CURSOR_PLANE, CFakeDrmCalls::PROP_SRC_W, 24ull << 16);
    EXPECT_EQ(drm->last().value, 64ull << 16);

    m->onAtomicAddProperty(FD, nullptr, CFakeDrmCalls::CURSOR_PLANE, CFakeDrmCalls::PROP_CRTC_H, 24);
    EXPECT_EQ(drm->last().value, 64u);

    m->onAtomicAddProperty(FD, nullptr, CFakeDrmCalls::CURSOR_PLANE, CFakeDrmCalls::PROP_CRTC_Y, 300);
    EXPECT_EQ(drm->last().value, 300u);

    // a second show reuses the buffer
    showAtomic(*m, 78);
    EXPECT_EQ(drm->createdDumbs, 1);
}

TEST_F(CursorOverride, atomicHideWithoutFadeForwardsZero) {
    auto m = make();

    showAtomic(*m);
    hideAtomic(*m);
    EXPECT_EQ(drm->last().value, 0u);

    // no longer substituting, sizes go through as the host wrote them
    m->onAtomicAddProperty(FD, nullptr, CFakeDrmCalls::CURSOR_PLANE, CFakeDrmCalls::PROP_SRC_W, 24ull << 16);
    EXPECT_EQ(drm->last().value, 24ull << 16);
}

TEST_F(CursorOverride, hotspotPropertiesFollowOurImage) {
    drm->properties[CFakeDrmCalls::CURSOR_PLANE]["HOTSPOT_X"] = {200, 0};
    drm->properties[CFakeDrmCalls::CURSOR_PLANE]["HOTSPOT_Y"] = {201, 0};
    auto m                                                    = make();

    showAtomic(*m);

    m->onAtomicAddProperty(FD, nullptr, CFakeDrmCalls::CURSOR_PLANE, 200, 1);
    EXPECT_EQ(drm->last().value, 5u);
    m->onAtomicAddProperty(FD, nullptr, CFakeDrmCalls::CURSOR_PLANE, 201, 1);
    EXPECT_EQ(drm->last().value, 5u);
}

TEST_F(CursorOverride, fadeOutKeepsOurBufferUntilTransparent) {
    auto m = make("fade_enabled = true\nfade_speed = 30\n");

    showAtomic(*m);
    hideAtomic(*m);

    EXPECT_EQ(drm->last().value, CFakeDrmCalls::OUR_FB);
    EXPECT_TRUE(m->fadeActive());
    EXPECT_EQ(m->stateSnapshot().targetAlpha, 0);

    uint8_t last  = m->stateSnapshot().alpha;
    int     ticks = 0;
    bool    done  = false;

    while (!done && ticks < 20) {
        done            = m->fadeTick();
        const auto NOW  = m->stateSnapshot().alpha;
        EXPECT_LT(NOW, last);
        last = NOW;
        ++ticks;
    }

    EXPECT_TRUE(done);
    EXPECT_EQ(ticks, 9);
    EXPECT_EQ(last, 0);
    EXPECT_TRUE(mappingIsBlank());
}

TEST_F(CursorOverride, fadeTicksOnlyReapplyAlpha) {
    auto m = make("fade_enabled = true\nfade_in_enabled = true\nfade_speed = 30\n");

    showAtomic(*m);
    const auto SYNTHESIZED = m->stateSnapshot().synthesisCount;
    const auto OPAQUE      = m->stateSnapshot().pixels;
    EXPECT_EQ(SYNTHESIZED, 1u);

    hideAtomic(*m);
    m->fadeTick();

    const auto HALFWAY = m->stateSnapshot();
    EXPECT_EQ(HALFWAY.alpha, 225);
    EXPECT_EQ(HALFWAY.opaquePixels, OPAQUE);
    EXPECT_NE(HALFWAY.pixels, OPAQUE);

    while (!m->fadeTick()) {
        ;
    }

    showAtomic(*m);
    while (!m->fadeTick()) {
        ;
    }

    const auto STATE = m->stateSnapshot();
    EXPECT_EQ(STATE.alpha, 255);
    EXPECT_EQ(STATE.pixels, OPAQUE);
    EXPECT_EQ(STATE.synthesisCount, SYNTHESIZED);
}

TEST_F(CursorOverride, envEnablesFade) {
    auto m = make("fade_enabled = false\n", SEnvOverrides{.fade = true});

    EXPECT_TRUE(m->config().fadeEnabled);

    showAtomic(*m);
    hideAtomic(*m);
    EXPECT_EQ(drm->last().value, CFakeDrmCalls::OUR_FB);
}

TEST_F(CursorOverride, fadeInAfterInstantHide) {
    auto m = make("fade_in_enabled = true\nfade_speed = 51\n");

    showAtomic(*m);
    EXPECT_EQ(m->stateSnapshot().alpha, 255);

    hideAtomic(*m);
    EXPECT_EQ(drm->last().value, 0u);
    EXPECT_EQ(m->stateSnapshot().alpha, 0);

    showAtomic(*m);
    EXPECT_EQ(drm->last().value, CFakeDrmCalls::OUR_FB);
    EXPECT_TRUE(m->fadeActive());

    int ticks = 0;
    while (!m->fadeTick() && ticks < 20) {
        ++ticks;
    }

    EXPECT_EQ(ticks + 1, 5);
    EXPECT_EQ(m->stateSnapshot().alpha, 255);
}

TEST_F(CursorOverride, legacySetCursor2UsesOurBufferAndHotspot) {
    auto m = make();

    EXPECT_EQ(m->onSetCursor2(FD, CRTC, 9, 32, 32, 4, 4), 0);

    const auto SET = drm->last();
    EXPECT_EQ(SET.name, "setCursor2");
    EXPECT_EQ(SET.bo, CFakeDrmCalls::DUMB_HANDLE);
    EXPECT_EQ(SET.width, 64u);
    EXPECT_EQ(SET.height, 64u);

    // the arrow's tip at 1.5x
    EXPECT_EQ(SET.x, 5);
    EXPECT_EQ(SET.y, 5);

    m->onMoveCursor(FD, CRTC, 100, 100);
    EXPECT_EQ(drm->last().name, "moveCursor");
    EXPECT_EQ(drm->last().x, 99);
    EXPECT_EQ(drm->last().y, 99);
}

TEST_F(CursorOverride, legacySetCursorCompensatesMissingHotspot) {
    auto m = make();

    m->onSetCursor(FD, CRTC, 9, 64, 64);
    EXPECT_EQ(drm->last().bo, CFakeDrmCalls::DUMB_HANDLE);

    m->onMoveCursor(FD, CRTC, 100, 100);
    EXPECT_EQ(drm->last().x, 95);
    EXPECT_EQ(drm->last().y, 95);
}

TEST_F(CursorOverride, legacyHideForwardsWithoutFade) {
    auto m = make();

    m->onSetCursor(FD, CRTC, 9, 64, 64);
    m->onSetCursor(FD, CRTC, 0, 0, 0);

    EXPECT_EQ(drm->last().name, "setCursor");
    EXPECT_EQ(drm->last().bo, 0u);

    // not substituting anymore, moves go through untouched
    m->onMoveCursor(FD, CRTC, 100, 100);
    EXPECT_EQ(drm->last().x, 100);
}

TEST_F(CursorOverride, rawIoctlIsRewrittenOnACopy) {
    auto             m = make();

    drm_mode_cursor2 req = {};
    req.flags            = DRM_MODE_CURSOR_BO;
    req.crtc_id          = CRTC;
    req.width            = 32;
    req.height           = 32;
    req.handle           = 9;
    req.hot_x            = 2;
    req.hot_y            = 2;

    EXPECT_EQ(m->onCursorIoctl(FD, DRM_IOCTL_MODE_CURSOR2, &req), 0);
    ASSERT_EQ(drm->cursorIoctls.size(), 1u);
    EXPECT_EQ(drm->forwardedIoctls, 1);
    EXPECT_EQ(drm->cursorIoctls.back().handle, CFakeDrmCalls::DUMB_HANDLE);
    EXPECT_EQ(drm->cursorIoctls.back().width, 64u);
    EXPECT_EQ(drm->cursorIoctls.back().hot_x, 5);

    // the host's struct is left alone
    EXPECT_EQ(req.handle, 9u);
    EXPECT_EQ(req.width, 32u);

    drm_mode_cursor2 move = {};
    move.flags            = DRM_MODE_CURSOR_MOVE;
    move.crtc_id          = CRTC;
    move.x                = 50;
    move.y                = 60;

    m->onCursorIoctl(FD, DRM_IOCTL_MODE_CURSOR2, &move);
    EXPECT_EQ(drm->cursorIoctls.back().flags, (uint32_t)DRM_MODE_CURSOR_MOVE);
    EXPECT_EQ(drm->cursorIoctls.back().x, 47);
    EXPECT_EQ(drm->cursorIoctls.back().y, 57);
}

TEST_F(CursorOverride, otherIoctlsAreUntouched) {
    auto              m = make();

    drm_mode_map_dumb map = {};
    map.handle            = 3;
    EXPECT_EQ(m->onCursorIoctl(FD, DRM_IOCTL_MODE_MAP_DUMB, &map), 0);
    EXPECT_TRUE(drm->cursorIoctls.empty());
    EXPECT_EQ(drm->createdDumbs, 0);
}

TEST_F(CursorOverride, hostIoctlErrorsAreNotRetried) {
    auto m = make();

    drm->forwardErrno     = EAGAIN;
    drm_mode_map_dumb map = {};
    map.handle            = 3;

    errno = 0;
    EXPECT_EQ(m->onCursorIoctl(FD, DRM_IOCTL_MODE_MAP_DUMB, &map), -1);
    EXPECT_EQ(errno, EAGAIN);
    EXPECT_EQ(drm->forwardedIoctls, 1);

    drm->forwardErrno = EINTR;
    drm_mode_cursor move = {};
    move.flags           = DRM_MODE_CURSOR_MOVE;
    move.crtc_id         = CRTC;

    errno = 0;
    EXPECT_EQ(m->onCursorIoctl(FD, DRM_IOCTL_MODE_CURSOR, &move), -1);
    EXPECT_EQ(errno, EINTR);
    EXPECT_EQ(drm->forwardedIoctls, 2);
    EXPECT_EQ(drm->ownIoctls, 0);
}

TEST_F(CursorOverride, controlTypeWaitsForRefresh) {
    auto m = make();

    fs->write("/run/type", "text");
    for (int i = 0; i < 120; ++i) {
        m->onMoveCursor(FD, CRTC, i, i);
    }

    EXPECT_EQ(m->stateSnapshot().type, CURSOR_DEFAULT);

    fs->touch("/run/refresh");
    m->onMoveCursor(FD, CRTC, 0, 0);

    EXPECT_EQ(m->stateSnapshot().type, CURSOR_TEXT);

    // committed values survive later settings reloads
    fs->write(SETTINGS, "cursor_scale = 2\n");
    for (int i = 0; i < 50; ++i) {
        m->onMoveCursor(FD, CRTC, i, i);
    }

    EXPECT_EQ(m->stateSnapshot().type, CURSOR_TEXT);
    EXPECT_FLOAT_EQ(m->stateSnapshot().scale, 2.F);
}

TEST_F(CursorOverride, envPinsTypeAndScale) {
    auto m = make("cursor_scale = 3\n", SEnvOverrides{.type = CURSOR_WAIT, .scale = 2.F});

    EXPECT_EQ(m->stateSnapshot().type, CURSOR_WAIT);
    EXPECT_FLOAT_EQ(m->stateSnapshot().scale, 2.F);

    fs->write("/run/type", "text");
    fs->write("/run/scale", "4");
    fs->touch("/run/refresh");
    m->onMoveCursor(FD, CRTC, 0, 0);

    EXPECT_EQ(m->stateSnapshot().type, CURSOR_WAIT);
    EXPECT_FLOAT_EQ(m->stateSnapshot().scale, 2.F);
}

TEST_F(CursorOverride, settingsReloadResizesSubstitutedPlane) {
    drm->cursorCap = 256;
    auto m         = make("cursor_scale = 1.5\n");

    showAtomic(*m);
    EXPECT_EQ(m->stateSnapshot().displaySize, 64u);

    fs->write(SETTINGS, "cursor_scale = 3\n");
    for (int i = 0; i < 50; ++i) {
        m->onAtomicAddProperty(FD, nullptr, CFakeDrmCalls::CURSOR_PLANE, CFakeDrmCalls::PROP_CRTC_X, i);
    }

    const auto STATE = m->stateSnapshot();
    EXPECT_FLOAT_EQ(STATE.scale, 3.F);
    EXPECT_EQ(STATE.displaySize, 128u);
    EXPECT_FALSE(STATE.dirty);

    m->onAtomicAddProperty(FD, nullptr, CFakeDrmCalls::CURSOR_PLANE, CFakeDrmCalls::PROP_SRC_W, 24ull << 16);
    EXPECT_EQ(drm->last().value, 128ull << 16);
}

TEST_F(CursorOverride, settingsReloadRestylesWithoutNewBuffer) {
    auto m = make();
    showAtomic(*m);

    fs->write(SETTINGS, "frost_intensity = 50\noutline_thickness = 2\n");
    for (int i = 0; i < 50; ++i) {
        m->onAtomicAddProperty(FD, nullptr, CFakeDrmCalls::CURSOR_PLANE, CFakeDrmCalls::PROP_CRTC_X, i);
    }

    EXPECT_EQ(m->config().frostIntensity, 50);
    EXPECT_EQ(m->stateSnapshot().frost, 50);
    EXPECT_EQ(drm->createdDumbs, 1);
}

TEST_F(CursorOverride, allocationFailureFallsBackToHost) {
    drm->failCreateDumb = true;
    auto m              = make();

    showAtomic(*m);
    EXPECT_EQ(drm->last().value, 77u);

    m->onSetCursor(FD, CRTC, 9, 64, 64);
    EXPECT_EQ(drm->last().bo, 9u);
}

TEST_F(CursorOverride, rejectedSubstitutionForwardsOriginal) {
    drm->rejectValue = CFakeDrmCalls::OUR_FB;
    auto m           = make();

    EXPECT_EQ(showAtomic(*m), 1);
    EXPECT_EQ(drm->last().value, 77u);
}

TEST_F(CursorOverride, planeEnumerationRetriesEmptyScan) {
    drm->planes = {CFakeDrmCalls::PRIMARY_PLANE};
    auto m      = make();

    EXPECT_FALSE(m->locator().locate(FD, CRTC).has_value());

    drm->planes = {CFakeDrmCalls::PRIMARY_PLANE, CFakeDrmCalls::CURSOR_PLANE};
    m->onGetPlane(FD, CFakeDrmCalls::CURSOR_PLANE);

    EXPECT_TRUE(m->locator().locate(FD, CRTC).has_value());
}

TEST_F(CursorOverride, settingsEditAppliedOnFiftiethMove) {
    auto m = make("config_poll_interval = 50\ncursor_scale = 1.5\n");

    fs->write(SETTINGS, "config_poll_interval = 50\ncursor_scale = 2.5\n");

    for (int i = 0; i < 49; ++i) {
        m->onMoveCursor(FD, CRTC, i, i);
    }

    EXPECT_FLOAT_EQ(m->stateSnapshot().scale, 1.5F);

    m->onMoveCursor(FD, CRTC, 50, 50);
    EXPECT_FLOAT_EQ(m->stateSnapshot().scale, 2.5F);
}

TEST_F(CursorOverride, customCursorFileReplacesTheType) {
    auto m = make();

    showAtomic(*m);
    const auto ARROW = m->stateSnapshot().pixels;
    EXPECT_FALSE(m->customShapeActive());

    fs->write("/run/custom", R"({"version": 2, "layers": [{"points": [{"x": 0, "y": 0}, {"x": 30, "y": 0}, {"x": 30, "y": 30}, {"x": 0, "y": 30}], "fill": "#00ff00"}]})");
    refresh(*m);

    EXPECT_TRUE(m->customShapeActive());
    const auto CUSTOM = m->stateSnapshot();
    EXPECT_NE(CUSTOM.pixels, ARROW);
    EXPECT_EQ(CUSTOM.reportedHotspot, Vector2D(5, 5));

    // the type control file has no say while the custom cursor exists
    fs->write("/run/type", "text");
    refresh(*m);
    EXPECT_EQ(m->stateSnapshot().type, CURSOR_TEXT);
    EXPECT_EQ(m->stateSnapshot().pixels, CUSTOM.pixels);

    fs->write("/run/type", "default");
    fs->write("/run/custom", "{ not json");
    refresh(*m);

    // broken files draw the arrow
    EXPECT_TRUE(m->customShapeActive());
    EXPECT_EQ(m->stateSnapshot().pixels, ARROW);

    fs->files.erase("/run/custom");
    refresh(*m);
    EXPECT_FALSE(m->customShapeActive());
    EXPECT_EQ(m->stateSnapshot().pixels, ARROW);
}
