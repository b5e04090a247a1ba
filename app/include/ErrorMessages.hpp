#ifndef ERRORMESSAGES_H
#define ERRORMESSAGES_H

#include <libintl.h>
#include "ErrorCode.hpp"

#define _(String) gettext(String)

// Status line texts. Placeholders are filled with fmt::format.
#define MSG_APPLIED _("{} done")
#define MSG_PARTIAL _("{}: {} target(s) failed")
#define MSG_NEEDS_ESCALATION _("Permission denied for {}. Enter sudo password (empty to cancel):")
#define MSG_ESCALATION_DECLINED _("Elevated retry cancelled; {} was not applied")
#define MSG_CANCELLED _("{} cancelled; {} partial item(s) left in place")
#define MSG_FAILED _("{} failed: {}")
#define MSG_UNDONE _("Undone: {}")
#define MSG_UNDO_FAILED _("Undo failed: {}")
#define MSG_NOTHING_TO_UNDO _("Nothing to undo")
#define MSG_QUEUE_FULL _("Too many operations queued; try again when the current one finishes")

namespace ErrorMessages {
    inline const char* get_message_for_code(ErrorCodes::Code code) {
        switch (code) {
        case ErrorCodes::Code::NOTHING_TO_UNDO:
            return MSG_NOTHING_TO_UNDO;
        default:
            return nullptr;
        }
    }
}

#endif
