#include "services/functions/ChangeFinePayedFunction.hpp"

#include <variant>

#include "core/errors/FunctionError.hpp"
#include "core/model/Person.hpp"
#include "core/model/ReasonTemplate.hpp"
#include "core/updatable/UpdatableReference.hpp"
#include "services/functions/Prerequirements.hpp"

namespace cft {

ChangeFinePayedFunction::ChangeFinePayedFunction(const nlohmann::json& data, FunctionContext& context)
  : context_(context), container_(data),
    trace_(TraceContext::start(kName, container_.getOptionalBool("verbose", false))),
    privateKey_(container_.getString("privateKey")),
    clubId_(container_.getGuid("clubId")),
    fineId_(container_.getGuid("fineId")),
    payedState_(PayedState::fromObject(container_.getParameter("payedState", ParameterType::Object),
                                       trace_.nested())),
    fineUpdateProperties_(UpdateProperties::fromParameterContainer(container_, "fineUpdateProperties", trace_)) {}

nlohmann::json ChangeFinePayedFunction::executeFunction(const std::optional<AuthState>& auth) {
  checkPrerequirements(context_, privateKey_, auth, clubId_, trace_.nested());

  const std::string club = clubPath(context_.config, clubId_);
  UpdatableReference<Fine> fineReference(context_.db, club + "/fines/" + fineId_.guidString(), fineId_);

  nlohmann::json previousFine;
  try {
    context_.db.runTransaction([&] {
      const auto current = fineReference.getActive(trace_.nested());
      const Fine& fine = *current.active();

      // Resolve what the statistic needs before anything is written.
      const auto person = UpdatableReference<Person>(context_.db, club + "/persons/" + fine.person_id.guidString(),
                                                     fine.person_id).getActive(trace_.nested());
      std::optional<Updatable<ReasonTemplate>> reasonTemplate;
      if (const auto* reference = std::get_if<FineReasonTemplate>(&fine.fine_reason.value)) {
        const Guid& templateId = reference->reason_template_id;
        reasonTemplate = UpdatableReference<ReasonTemplate>(
            context_.db, club + "/reasonTemplates/" + templateId.guidString(), templateId)
            .getActive(trace_.nested());
      }
      previousFine = fine.statistic(*person.active(), reasonTemplate ? reasonTemplate->active() : nullptr);

      Fine changed = fine;
      changed.payed_state = payedState_;
      fineReference.change(Updatable<Fine>(changed, fineUpdateProperties_), UpdatePolicy::Strict, trace_.nested());
    });
  } catch (const DatabaseError& e) {
    throw internalError("change payed state of fine", e);
  }

  context_.statistics.record(club,
                             StatisticsEvent{kName, currentTimestamp(),
                                             {{"previousFine", previousFine},
                                              {"changedState", payedState_.databaseObject()}}},
                             trace_.nested());
  return nullptr;
}

} // namespace cft
