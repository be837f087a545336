#include "explanations.hpp"

namespace usbspeed::text
{

static const std::string kHighText =
    "The USB controller runs at high-speed (480 Mbit/s). This is the\n"
    "default and gives the best throughput for storage, network and\n"
    "camera devices.\n"
    "\n"
    "Full-speed and low-speed devices (keyboards, mice, MIDI and audio\n"
    "interfaces, serial adapters) reach the controller through the\n"
    "transaction translator of a high-speed hub. Some of them drop data,\n"
    "disconnect or fail to enumerate in this configuration, in particular\n"
    "isochronous audio devices and devices behind cheap hubs.\n"
    "\n"
    "If such a device misbehaves, try full-speed mode with --full.\n";

static const std::string kFullText =
    "The USB controller is limited to full-speed (12 Mbit/s). Every\n"
    "device, including high-speed ones, is run at full-speed.\n"
    "\n"
    "This avoids split transactions and usually fixes full-speed and\n"
    "low-speed devices (MIDI and audio interfaces, serial adapters, some\n"
    "keyboards) that drop data or fail to enumerate in high-speed mode.\n"
    "\n"
    "High-speed devices keep working but are much slower: mass storage,\n"
    "network adapters and webcams may become unusable, and the onboard\n"
    "Ethernet of some boards, which sits on the USB bus, is limited too.\n"
    "\n"
    "To restore the default, use --high.\n";

const std::string& explanation(SpeedMode mode)
{
    return mode == SpeedMode::High ? kHighText : kFullText;
}

} // namespace usbspeed::text
