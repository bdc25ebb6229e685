#include <gmock/gmock.h>

#include <QApplication>

int main(int argc, char **argv)
{
    // test discovery runs this binary too, so do not depend on the environment for a display
    if (!qEnvironmentVariableIsSet("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    ::testing::InitGoogleMock(&argc, argv);
    QApplication app(argc, argv);
    return RUN_ALL_TESTS();
}
