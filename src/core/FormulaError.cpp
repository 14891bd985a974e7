#include "core/FormulaError.h"

QString SourcePosition::toString() const {
  return QString("index %1 (line %2, column %3)").arg(index).arg(line).arg(column);
}

const FormulaError &FormulaError::rootCause() const {
  const FormulaError *current = this;
  while (current->cause)
    current = current->cause.get();
  return *current;
}

QString FormulaError::kindName(Kind kind) {
  switch (kind) {
  case Kind::None:
    return "None";
  case Kind::UnexpectedCharacter:
    return "UnexpectedCharacter";
  case Kind::UnclosedVariable:
    return "UnclosedVariable";
  case Kind::InvalidNumberFormat:
    return "InvalidNumberFormat";
  case Kind::InvalidTokenSequence:
    return "InvalidTokenSequence";
  case Kind::InvalidGrammar:
    return "InvalidGrammar";
  case Kind::GrammarConflict:
    return "GrammarConflict";
  case Kind::EmptyCoreItems:
    return "EmptyCoreItems";
  case Kind::LalrMergeRejected:
    return "LalrMergeRejected";
  case Kind::UnexpectedToken:
    return "UnexpectedToken";
  case Kind::TooDeep:
    return "TooDeep";
  case Kind::TooManySteps:
    return "TooManySteps";
  case Kind::ChildCountMismatch:
    return "ChildCountMismatch";
  case Kind::ChildTypeMismatch:
    return "ChildTypeMismatch";
  case Kind::MissingBuilder:
    return "MissingBuilder";
  case Kind::UndefinedVariable:
    return "UndefinedVariable";
  case Kind::DivisionByZero:
    return "DivisionByZero";
  case Kind::UnsupportedOperator:
    return "UnsupportedOperator";
  case Kind::UnsupportedFunction:
    return "UnsupportedFunction";
  case Kind::WrongArgumentCount:
    return "WrongArgumentCount";
  case Kind::UnsupportedType:
    return "UnsupportedType";
  case Kind::NumberConversionError:
    return "NumberConversionError";
  case Kind::MathError:
    return "MathError";
  case Kind::EmptySteps:
    return "EmptySteps";
  case Kind::StepExecutionError:
    return "StepExecutionError";
  case Kind::InvalidFormulaSet:
    return "InvalidFormulaSet";
  case Kind::TooLarge:
    return "TooLarge";
  case Kind::TooManyVariables:
    return "TooManyVariables";
  case Kind::InvalidFormula:
    return "InvalidFormula";
  case Kind::VariableExtractionFailed:
    return "VariableExtractionFailed";
  case Kind::InvalidConfiguration:
    return "InvalidConfiguration";
  }
  return "Unknown";
}

QString FormulaError::toString() const {
  if (!isError())
    return QString();

  QString text = QString("%1: %2").arg(kindName(kind), message);
  if (hasPosition)
    text += QString(" at %1").arg(position.toString());
  if (limit >= 0)
    text += QString(" [limit %1, observed %2]").arg(limit).arg(observed);
  if (cause)
    text += QString(" <- %1").arg(cause->toString());
  return text;
}

QJsonObject FormulaError::toJson() const {
  QJsonObject json;
  json["kind"] = kindName(kind);
  json["message"] = message;
  if (!offendingText.isEmpty())
    json["offending_text"] = offendingText;
  if (hasPosition) {
    QJsonObject pos;
    pos["index"] = position.index;
    pos["line"] = position.line;
    pos["column"] = position.column;
    json["position"] = pos;
  }
  if (limit >= 0) {
    json["limit"] = double(limit);
    json["observed"] = double(observed);
  }
  if (stepIndex >= 0)
    json["step_index"] = stepIndex;
  if (cause)
    json["cause"] = cause->toJson();
  return json;
}

FormulaError FormulaError::make(Kind kind, const QString &message,
                                const QString &offendingText) {
  FormulaError err;
  err.kind = kind;
  err.message = message;
  err.offendingText = offendingText;
  return err;
}

FormulaError FormulaError::at(Kind kind, const QString &message,
                              const QString &offendingText,
                              const SourcePosition &position) {
  FormulaError err = make(kind, message, offendingText);
  err.position = position;
  err.hasPosition = true;
  return err;
}

FormulaError FormulaError::limitExceeded(Kind kind, const QString &what,
                                         qint64 limit, qint64 observed) {
  FormulaError err = make(
      kind, QString("%1 exceeds the configured limit (%2 > %3)")
                .arg(what)
                .arg(observed)
                .arg(limit));
  err.limit = limit;
  err.observed = observed;
  return err;
}

FormulaError FormulaError::wrap(Kind kind, const QString &message,
                                const FormulaError &cause) {
  FormulaError err = make(kind, message, cause.offendingText);
  err.position = cause.position;
  err.hasPosition = cause.hasPosition;
  err.cause = std::make_shared<const FormulaError>(cause);
  return err;
}
