#include "backend/media/IMediaSession.h"

QString mediaStatusToString(MediaStatus status) {
    switch (status) {
        case MediaStatus::Connecting: return "connecting";
        case MediaStatus::Connected: return "connected";
        case MediaStatus::Lost: return "lost";
        case MediaStatus::Failed: return "failed";
    }
    return "unknown";
}
