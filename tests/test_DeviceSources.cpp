#include <gtest/gtest.h>

#include "device/platform/DeviceSourceFactory.h"
#include "serial/SerialPortSource.h"

#if defined(__linux__) && defined(HAVE_LIBUDEV)
#include "device/platform/LinuxDeviceSource.h"
#endif

TEST(DeviceSourceFactoryTest, PortSourceExistsOnEveryPlatform)
{
    std::unique_ptr<AbstractPortSource> source = DeviceSourceFactory::createPortSource();

    ASSERT_TRUE(source != nullptr);
    EXPECT_EQ(source->getPlatformName(), DeviceSourceFactory::getCurrentPlatform());
}

TEST(DeviceSourceFactoryTest, DeviceSourceMatchesSupportedPlatforms)
{
    std::unique_ptr<AbstractDeviceSource> source = DeviceSourceFactory::createDeviceSource();

    EXPECT_EQ(source != nullptr, DeviceSourceFactory::isPlatformSupported());
    EXPECT_FALSE(DeviceSourceFactory::isPlatformSupported("Amiga"));
    if (source) {
        EXPECT_EQ(source->getPlatformName(), DeviceSourceFactory::getCurrentPlatform());
    }
}

TEST(SerialPortSourceTest, EnumeratedPortsAreAvailableAndClosed)
{
    SerialPortSource source;

    const QList<ComPort> ports = source.fetchPorts();
    for (const auto& port : ports) {
        EXPECT_FALSE(port.portName.isEmpty());
        EXPECT_TRUE(port.isAvailable);
        EXPECT_FALSE(port.isOpen);
    }
}

#if defined(__linux__) && defined(HAVE_LIBUDEV)

TEST(LinuxDeviceSourceTest, SpeedLabelsFromSysfs)
{
    EXPECT_EQ(LinuxDeviceSource::formatSpeed("1.5"), "1.5 Mb/s");
    EXPECT_EQ(LinuxDeviceSource::formatSpeed("480"), "480 Mb/s");
    EXPECT_EQ(LinuxDeviceSource::formatSpeed("5000"), "5 Gb/s");
    EXPECT_EQ(LinuxDeviceSource::formatSpeed("10000"), "10 Gb/s");
    EXPECT_TRUE(LinuxDeviceSource::formatSpeed("").isEmpty());
    EXPECT_TRUE(LinuxDeviceSource::formatSpeed("unknown").isEmpty());
}

TEST(LinuxDeviceSourceTest, MaxSpeedFromUsbVersion)
{
    EXPECT_EQ(LinuxDeviceSource::maxSpeedForVersion(" 2.00"), "480 Mb/s");
    EXPECT_EQ(LinuxDeviceSource::maxSpeedForVersion("3.00"), "5 Gb/s");
    EXPECT_EQ(LinuxDeviceSource::maxSpeedForVersion("3.10"), "10 Gb/s");
    EXPECT_EQ(LinuxDeviceSource::maxSpeedForVersion("1.10"), "12 Mb/s");
    EXPECT_TRUE(LinuxDeviceSource::maxSpeedForVersion("").isEmpty());
}

TEST(LinuxDeviceSourceTest, ClassNames)
{
    EXPECT_EQ(LinuxDeviceSource::deviceClassName("09"), "Hub");
    EXPECT_EQ(LinuxDeviceSource::deviceClassName("08"), "Mass Storage");
    EXPECT_EQ(LinuxDeviceSource::deviceClassName("EF"), "Miscellaneous");
    EXPECT_EQ(LinuxDeviceSource::deviceClassName("42"), "Class 42");
    EXPECT_TRUE(LinuxDeviceSource::deviceClassName("").isEmpty());
}

TEST(LinuxDeviceSourceTest, EnumeratedDevicesCarryIdentity)
{
    LinuxDeviceSource source;

    QList<UsbDevice> devices;
    try {
        devices = source.fetchDevices();
    } catch (const SourceUnavailableError& e) {
        GTEST_SKIP() << "udev unavailable: " << e.what();
    }

    for (const auto& device : devices) {
        EXPECT_FALSE(device.getUniqueKey().isEmpty());
        EXPECT_TRUE(device.isConnected);
    }
}

#endif
