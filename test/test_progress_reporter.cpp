#include <cassert>
#include <cstdio>
#include <cmath>
#include <vector>
#include "media/ProgressReporter.h"
#include "FakeEncoderEngine.h"

void test_filters_progress_lines() {
    std::vector<ProgressUpdate> updates;
    ProgressReporter reporter(240, [&updates](const ProgressUpdate& u) { updates.push_back(u); });

    reporter.handleLogLine("Input #0, png_pipe, from 'frame.png':");
    reporter.handleLogLine("frame=   60 fps= 30 q=28.0 size=     256kB time=00:00:02.00");
    reporter.handleLogLine("  Stream #0:0: Video: png");
    reporter.handleLogLine(" frame=  999");   // must start the line
    reporter.handleLogLine("frame=  240 fps= 30 q=-1.0 Lsize=  1024kB");

    assert(reporter.forwardedCount() == 2);
    assert(updates.size() == 2);
    assert(updates[0].frame == 60);
    assert(std::abs(updates[0].fraction - 0.25) < 1e-9);
    assert(updates[0].line.startsWith("frame=   60"));
    assert(updates[1].frame == 240);
    assert(std::abs(updates[1].fraction - 1.0) < 1e-9);
    printf("PASS: test_filters_progress_lines\n");
}

void test_fraction_is_clamped() {
    ProgressUpdate last;
    ProgressReporter reporter(150, [&last](const ProgressUpdate& u) { last = u; });

    reporter.handleLogLine("frame=  400 fps=30");
    assert(last.frame == 400);
    assert(last.fraction == 1.0);

    reporter.handleLogLine("frame=N/A fps=0");
    assert(last.frame == -1);
    assert(last.fraction == 0.0);
    assert(reporter.forwardedCount() == 2);
    printf("PASS: test_fraction_is_clamped\n");
}

void test_parse_frame_number() {
    assert(ProgressReporter::parseFrameNumber("frame=0") == 0);
    assert(ProgressReporter::parseFrameNumber("frame=    17 fps=0.0") == 17);
    assert(ProgressReporter::parseFrameNumber("frames=12") == -1);
    assert(ProgressReporter::parseFrameNumber("size=12") == -1);
    assert(ProgressReporter::isProgressLine("frame= 1"));
    assert(!ProgressReporter::isProgressLine("Frame= 1"));
    printf("PASS: test_parse_frame_number\n");
}

void test_subscription_is_scoped() {
    FakeEncoderEngine engine;
    assert(engine.logListenerCount() == 0);

    int received = 0;
    {
        LogSubscription subscription(engine, [&received](const QString&) { ++received; });
        assert(engine.logListenerCount() == 1);
        engine.logLines = {"frame=1", "frame=2"};
        assert(engine.exec({"out.mp4"}));
        assert(engine.listenersDuringExec == 1);
    }
    assert(engine.logListenerCount() == 0);
    assert(received == 2);

    // Nobody hears lines emitted after the subscription ended
    assert(engine.exec({"out.mp4"}));
    assert(received == 2);
    printf("PASS: test_subscription_is_scoped\n");
}

int main() {
    test_filters_progress_lines();
    test_fraction_is_clamped();
    test_parse_frame_number();
    test_subscription_is_scoped();
    printf("All progress reporter tests passed.\n");
    return 0;
}
